#pragma once

#include <utility>

// Runs the stored callable when leaving the scope
template<class FunT>
class AtScopeExit
{
  public:
    AtScopeExit(FunT fun)
        : m_OnExit{ std::move(fun) }
    {
    }

    AtScopeExit(const AtScopeExit&) = delete;
    AtScopeExit(AtScopeExit&&) = delete;
    AtScopeExit& operator=(const AtScopeExit&) = delete;
    AtScopeExit& operator=(AtScopeExit&&) = delete;

    ~AtScopeExit()
    {
        m_OnExit();
    }

  private:
    FunT m_OnExit;
};

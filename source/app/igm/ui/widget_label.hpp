#pragma once

#include <span>
#include <string_view>
#include <type_traits>

#include <magic_enum/magic_enum.hpp>

#include <QComboBox>
#include <QDoubleSpinBox>
#include <QLabel>
#include <QWidget>

#include <igm/qt_util.hpp>
#include <igm/util.hpp>

class WidgetWithLabel : public QWidget
{
  public:
    WidgetWithLabel(std::string_view label_text, QWidget* widget);

    QLabel* GetLabel() const;
    virtual QWidget* GetWidget() const;

  private:
    QLabel* m_Label;
    QWidget* m_Widget;
};

class ComboBoxWithLabel : public WidgetWithLabel
{
  public:
    ComboBoxWithLabel(std::string_view label_text,
                      std::span<const std::string_view> options,
                      std::string_view default_option);

    template<class T>
        requires std::is_enum_v<T>
    ComboBoxWithLabel(std::string_view label_text,
                      T default_option)
        : ComboBoxWithLabel{
            label_text,
            magic_enum::enum_names<T>(),
            magic_enum::enum_name(default_option)
        }
    {
    }

    virtual QComboBox* GetWidget() const override;
};

class DoubleSpinBoxWithLabel : public WidgetWithLabel
{
  public:
    DoubleSpinBoxWithLabel(std::string_view label_text);

    virtual QDoubleSpinBox* GetWidget() const override;
};

#pragma once

#include <QWidget>

#include <igm/util.hpp>

class QProgressBar;
class QPushButton;

class GridWorker;

class ActionsWidget : public QWidget
{
    Q_OBJECT

  public:
    ActionsWidget(GridWorker& worker);

  signals:
    void RenderRequested(const fs::path& output);

  private:
    void SetRendering(bool rendering);

    QProgressBar* m_ProgressBar;
    QPushButton* m_RenderButton;
    QPushButton* m_CancelButton;
};

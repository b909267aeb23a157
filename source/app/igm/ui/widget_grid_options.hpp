#pragma once

#include <QWidget>

class QCheckBox;
class QComboBox;
class QDoubleSpinBox;
class QPushButton;
class QSpinBox;

struct GridSettings;

class GridOptionsWidget : public QWidget
{
    Q_OBJECT

  public:
    GridOptionsWidget(GridSettings& settings);

  public slots:
    // Pulls all values from the settings again, e.g. after loading a file
    void Refresh();

  signals:
    void SettingsChanged();

  private:
    void SetDefaults();
    void UpdateColorButton();

    GridSettings& m_Settings;

    QDoubleSpinBox* m_RowHeightSpin{ nullptr };
    QDoubleSpinBox* m_ColWidthSpin{ nullptr };

    QCheckBox* m_GridVisibleCheckbox{ nullptr };
    QPushButton* m_GridColorButton{ nullptr };
    QDoubleSpinBox* m_GridWidthSpin{ nullptr };

    QComboBox* m_PageSizeCombo{ nullptr };
    QDoubleSpinBox* m_MarginTopSpin{ nullptr };
    QDoubleSpinBox* m_MarginBottomSpin{ nullptr };
    QDoubleSpinBox* m_MarginLeftSpin{ nullptr };
    QDoubleSpinBox* m_MarginRightSpin{ nullptr };

    QSpinBox* m_DpiSpin{ nullptr };
};

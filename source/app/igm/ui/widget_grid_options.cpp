#include <igm/ui/widget_grid_options.hpp>

#include <cmath>

#include <QCheckBox>
#include <QColorDialog>
#include <QPushButton>
#include <QSignalBlocker>
#include <QSpinBox>
#include <QVBoxLayout>

#include <dla/scalar_math.h>

#include <magic_enum/magic_enum.hpp>

#include <igm/color.hpp>
#include <igm/grid_settings.hpp>
#include <igm/qt_util.hpp>

#include <igm/ui/widget_label.hpp>

GridOptionsWidget::GridOptionsWidget(GridSettings& settings)
    : m_Settings{ settings }
{
    setObjectName("Grid Options");

    auto make_length_spin{
        [](DoubleSpinBoxWithLabel* widget, double min, double max, const char* tooltip)
        {
            auto* spin_box{ widget->GetWidget() };
            spin_box->setDecimals(1);
            spin_box->setSingleStep(0.5);
            spin_box->setRange(min, max);
            spin_box->setSuffix(" mm");
            spin_box->setToolTip(tooltip);
            return spin_box;
        }
    };

    auto* row_height{ new DoubleSpinBoxWithLabel{ "Row &Height" } };
    m_RowHeightSpin = make_length_spin(row_height, 1.0, 500.0, "Height of every cell in the grid");

    auto* col_width{ new DoubleSpinBoxWithLabel{ "Column &Width" } };
    m_ColWidthSpin = make_length_spin(col_width, 1.0, 500.0, "Width of every cell in the grid");

    m_GridVisibleCheckbox = new QCheckBox{ "Show Grid Lines" };
    m_GridVisibleCheckbox->setToolTip("Decides whether grid lines are drawn along the cell boundaries");

    m_GridColorButton = new QPushButton;
    auto* grid_color{ new WidgetWithLabel{ "Grid Color", m_GridColorButton } };

    auto* grid_width{ new DoubleSpinBoxWithLabel{ "Grid Thic&kness" } };
    m_GridWidthSpin = grid_width->GetWidget();
    m_GridWidthSpin->setDecimals(1);
    m_GridWidthSpin->setSingleStep(0.1);
    m_GridWidthSpin->setRange(0.1, 10.0);
    m_GridWidthSpin->setSuffix(" pt");
    m_GridWidthSpin->setToolTip("Stroke width of the grid lines");

    auto* page_size{ new ComboBoxWithLabel{ "&Paper Size", m_Settings.m_PageSize } };
    m_PageSizeCombo = page_size->GetWidget();

    auto* margin_top{ new DoubleSpinBoxWithLabel{ "Margin &Top" } };
    m_MarginTopSpin = make_length_spin(margin_top, 0.0, 100.0, "Unprinted space at the top of each page");
    auto* margin_bottom{ new DoubleSpinBoxWithLabel{ "Margin &Bottom" } };
    m_MarginBottomSpin = make_length_spin(margin_bottom, 0.0, 100.0, "Unprinted space at the bottom of each page");
    auto* margin_left{ new DoubleSpinBoxWithLabel{ "Margin &Left" } };
    m_MarginLeftSpin = make_length_spin(margin_left, 0.0, 100.0, "Unprinted space at the left of each page");
    auto* margin_right{ new DoubleSpinBoxWithLabel{ "Margin &Right" } };
    m_MarginRightSpin = make_length_spin(margin_right, 0.0, 100.0, "Unprinted space at the right of each page");

    m_DpiSpin = new QSpinBox;
    m_DpiSpin->setRange(72, 1200);
    m_DpiSpin->setSingleStep(50);
    m_DpiSpin->setSuffix(" dpi");
    m_DpiSpin->setKeyboardTracking(false);
    m_DpiSpin->setToolTip("Images are downsampled to this resolution before being embedded");
    auto* dpi{ new WidgetWithLabel{ "Output &Resolution", m_DpiSpin } };

    auto* layout{ new QVBoxLayout };
    layout->addWidget(row_height);
    layout->addWidget(col_width);
    layout->addWidget(m_GridVisibleCheckbox);
    layout->addWidget(grid_color);
    layout->addWidget(grid_width);
    layout->addWidget(page_size);
    layout->addWidget(margin_top);
    layout->addWidget(margin_bottom);
    layout->addWidget(margin_left);
    layout->addWidget(margin_right);
    layout->addWidget(dpi);
    layout->addStretch();
    setLayout(layout);

    SetDefaults();

    auto change_length{
        [this](Length& target)
        {
            return [this, &target](double v)
            {
                const auto new_length{ static_cast<float>(v) * 1_mm };
                if (dla::math::abs(target - new_length) < 0.001_mm)
                {
                    return;
                }

                target = new_length;
                SettingsChanged();
            };
        }
    };

    auto change_grid_visible{
        [this](Qt::CheckState s)
        {
            const bool enabled{ s == Qt::CheckState::Checked };
            m_Settings.m_GridLineVisible = enabled;
            m_GridColorButton->setEnabled(enabled);
            m_GridWidthSpin->setEnabled(enabled);
            SettingsChanged();
        }
    };

    auto pick_color{
        [this]()
        {
            const QColor picked{
                QColorDialog::getColor(ToQColor(m_Settings.m_GridColor), this, "Grid Color")
            };
            if (picked.isValid())
            {
                m_Settings.m_GridColor = FromQColor(picked);
                UpdateColorButton();
                SettingsChanged();
            }
        }
    };

    auto change_grid_width{
        [this](double v)
        {
            m_Settings.m_GridLineWidth = static_cast<float>(v) * 1_pts;
            SettingsChanged();
        }
    };

    auto change_page_size{
        [this](const QString& t)
        {
            if (const auto page_size{ magic_enum::enum_cast<PageSize>(t.toStdString()) })
            {
                m_Settings.m_PageSize = page_size.value();
                SettingsChanged();
            }
        }
    };

    auto change_dpi{
        [this](int v)
        {
            m_Settings.m_OutputDpi = static_cast<float>(v) * 1_dpi;
            SettingsChanged();
        }
    };

    QObject::connect(m_RowHeightSpin,
                     &QDoubleSpinBox::valueChanged,
                     this,
                     change_length(m_Settings.m_RowHeight));
    QObject::connect(m_ColWidthSpin,
                     &QDoubleSpinBox::valueChanged,
                     this,
                     change_length(m_Settings.m_ColWidth));
    QObject::connect(m_GridVisibleCheckbox,
                     &QCheckBox::checkStateChanged,
                     this,
                     change_grid_visible);
    QObject::connect(m_GridColorButton,
                     &QPushButton::clicked,
                     this,
                     pick_color);
    QObject::connect(m_GridWidthSpin,
                     &QDoubleSpinBox::valueChanged,
                     this,
                     change_grid_width);
    QObject::connect(m_PageSizeCombo,
                     &QComboBox::currentTextChanged,
                     this,
                     change_page_size);
    QObject::connect(m_MarginTopSpin,
                     &QDoubleSpinBox::valueChanged,
                     this,
                     change_length(m_Settings.m_Margins.m_Top));
    QObject::connect(m_MarginBottomSpin,
                     &QDoubleSpinBox::valueChanged,
                     this,
                     change_length(m_Settings.m_Margins.m_Bottom));
    QObject::connect(m_MarginLeftSpin,
                     &QDoubleSpinBox::valueChanged,
                     this,
                     change_length(m_Settings.m_Margins.m_Left));
    QObject::connect(m_MarginRightSpin,
                     &QDoubleSpinBox::valueChanged,
                     this,
                     change_length(m_Settings.m_Margins.m_Right));
    QObject::connect(m_DpiSpin,
                     &QSpinBox::valueChanged,
                     this,
                     change_dpi);
}

void GridOptionsWidget::Refresh()
{
    SetDefaults();
    SettingsChanged();
}

void GridOptionsWidget::SetDefaults()
{
    const QSignalBlocker block_row_height{ m_RowHeightSpin };
    const QSignalBlocker block_col_width{ m_ColWidthSpin };
    const QSignalBlocker block_grid_visible{ m_GridVisibleCheckbox };
    const QSignalBlocker block_grid_width{ m_GridWidthSpin };
    const QSignalBlocker block_page_size{ m_PageSizeCombo };
    const QSignalBlocker block_margin_top{ m_MarginTopSpin };
    const QSignalBlocker block_margin_bottom{ m_MarginBottomSpin };
    const QSignalBlocker block_margin_left{ m_MarginLeftSpin };
    const QSignalBlocker block_margin_right{ m_MarginRightSpin };
    const QSignalBlocker block_dpi{ m_DpiSpin };

    m_RowHeightSpin->setValue(m_Settings.m_RowHeight / 1_mm);
    m_ColWidthSpin->setValue(m_Settings.m_ColWidth / 1_mm);

    m_GridVisibleCheckbox->setChecked(m_Settings.m_GridLineVisible);
    m_GridColorButton->setEnabled(m_Settings.m_GridLineVisible);
    m_GridWidthSpin->setEnabled(m_Settings.m_GridLineVisible);
    m_GridWidthSpin->setValue(m_Settings.m_GridLineWidth / 1_pts);
    UpdateColorButton();

    m_PageSizeCombo->setCurrentText(ToQString(magic_enum::enum_name(m_Settings.m_PageSize)));

    m_MarginTopSpin->setValue(m_Settings.m_Margins.m_Top / 1_mm);
    m_MarginBottomSpin->setValue(m_Settings.m_Margins.m_Bottom / 1_mm);
    m_MarginLeftSpin->setValue(m_Settings.m_Margins.m_Left / 1_mm);
    m_MarginRightSpin->setValue(m_Settings.m_Margins.m_Right / 1_mm);

    m_DpiSpin->setValue(static_cast<int>(std::round(m_Settings.m_OutputDpi / 1_dpi)));
}

void GridOptionsWidget::UpdateColorButton()
{
    m_GridColorButton->setText(ToQString(ColorToHex(m_Settings.m_GridColor)));
    m_GridColorButton->setStyleSheet(
        QString{ "background-color: %1;" }.arg(ToQString(ColorToHex(m_Settings.m_GridColor))));
}

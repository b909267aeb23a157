#include <igm/ui/widget_label.hpp>

#include <limits>

#include <QHBoxLayout>
#include <QLabel>

namespace
{
QComboBox* MakeComboBox(std::span<const std::string_view> options, std::string_view default_option)
{
    auto* combo_box{ new QComboBox };
    for (const auto& option : options)
    {
        combo_box->addItem(ToQString(option));
    }
    combo_box->setCurrentText(ToQString(default_option));
    return combo_box;
}

QDoubleSpinBox* MakeDoubleSpinBox()
{
    auto* spin_box{ new QDoubleSpinBox };
    spin_box->setRange(0, std::numeric_limits<float>::max());
    spin_box->setKeyboardTracking(false);
    return spin_box;
}
} // namespace

WidgetWithLabel::WidgetWithLabel(std::string_view label_text, QWidget* widget)
    : QWidget{ nullptr }
    , m_Widget{ widget }
{
    m_Label = new QLabel(label_text.empty() ? "" : ToQString(label_text) + ":");
    if (label_text.contains("&"))
    {
        m_Label->setBuddy(widget);
    }

    auto* layout{ new QHBoxLayout };
    layout->addWidget(m_Label);
    layout->addWidget(widget);
    layout->setContentsMargins(0, 0, 0, 0);

    setLayout(layout);
}

QLabel* WidgetWithLabel::GetLabel() const
{
    return m_Label;
}

QWidget* WidgetWithLabel::GetWidget() const
{
    return m_Widget;
}

ComboBoxWithLabel::ComboBoxWithLabel(std::string_view label_text,
                                     std::span<const std::string_view> options,
                                     std::string_view default_option)
    : WidgetWithLabel{
        label_text,
        MakeComboBox(options, default_option),
    }
{
}

QComboBox* ComboBoxWithLabel::GetWidget() const
{
    return static_cast<QComboBox*>(WidgetWithLabel::GetWidget());
}

DoubleSpinBoxWithLabel::DoubleSpinBoxWithLabel(std::string_view label_text)
    : WidgetWithLabel(label_text, MakeDoubleSpinBox())
{
}

QDoubleSpinBox* DoubleSpinBoxWithLabel::GetWidget() const
{
    return static_cast<QDoubleSpinBox*>(WidgetWithLabel::GetWidget());
}

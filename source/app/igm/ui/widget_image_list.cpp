#include <igm/ui/widget_image_list.hpp>

#include <QAbstractItemModel>
#include <QHBoxLayout>
#include <QListWidget>
#include <QMessageBox>
#include <QPushButton>
#include <QVBoxLayout>

#include <igm/qt_util.hpp>
#include <igm/util/log.hpp>

#include <igm/ui/popups.hpp>

ImageListWidget::ImageListWidget()
{
    setObjectName("Image List");

    m_List = new QListWidget;
    m_List->setSelectionMode(QAbstractItemView::SelectionMode::ExtendedSelection);
    m_List->setDragDropMode(QAbstractItemView::DragDropMode::InternalMove);
    m_List->setDefaultDropAction(Qt::DropAction::MoveAction);
    m_List->setToolTip("Images are placed into the grid in this order, drag to reorder");

    auto* add_button{ new QPushButton{ "Add Images" } };
    auto* remove_button{ new QPushButton{ "Remove Selected" } };
    auto* clear_button{ new QPushButton{ "Clear" } };

    auto* buttons_layout{ new QHBoxLayout };
    buttons_layout->addWidget(add_button);
    buttons_layout->addWidget(remove_button);
    buttons_layout->addWidget(clear_button);
    buttons_layout->setContentsMargins(0, 0, 0, 0);

    auto* layout{ new QVBoxLayout };
    layout->addWidget(m_List);
    layout->addLayout(buttons_layout);
    setLayout(layout);

    const auto add_images{
        [this]()
        {
            const auto images{ OpenImagesDialog(cwd()) };
            AddImages(images);
        }
    };

    const auto clear_images{
        [this]()
        {
            if (m_List->count() == 0)
            {
                return;
            }

            const auto choice{
                QMessageBox::question(window(),
                                      "Clear Images",
                                      "Remove all images from the list?")
            };
            if (choice == QMessageBox::StandardButton::Yes)
            {
                Clear();
            }
        }
    };

    QObject::connect(add_button,
                     &QPushButton::clicked,
                     this,
                     add_images);
    QObject::connect(remove_button,
                     &QPushButton::clicked,
                     this,
                     &ImageListWidget::RemoveSelected);
    QObject::connect(clear_button,
                     &QPushButton::clicked,
                     this,
                     clear_images);

    // Reordering by drag moves rows inside the model
    QObject::connect(m_List->model(),
                     &QAbstractItemModel::rowsMoved,
                     this,
                     &ImageListWidget::ImagesChanged);
}

std::vector<fs::path> ImageListWidget::Images() const
{
    std::vector<fs::path> images{};
    images.reserve(m_List->count());
    for (int i = 0; i < m_List->count(); i++)
    {
        images.push_back(ToFsPath(m_List->item(i)->data(Qt::ItemDataRole::UserRole).toString()));
    }
    return images;
}

size_t ImageListWidget::ImageCount() const
{
    return static_cast<size_t>(m_List->count());
}

void ImageListWidget::AddImages(std::span<const fs::path> images)
{
    bool any_added{ false };
    for (const auto& image : images)
    {
        any_added = AppendImage(image) || any_added;
    }

    if (any_added)
    {
        ImagesChanged();
    }
}

void ImageListWidget::AddImage(const fs::path& image)
{
    if (AppendImage(image))
    {
        ImagesChanged();
    }
}

void ImageListWidget::RemoveSelected()
{
    const auto selected{ m_List->selectedItems() };
    if (selected.isEmpty())
    {
        return;
    }

    for (auto* item : selected)
    {
        delete m_List->takeItem(m_List->row(item));
    }
    ImagesChanged();
}

void ImageListWidget::Clear()
{
    m_List->clear();
    ImagesChanged();
}

bool ImageListWidget::AppendImage(const fs::path& image)
{
    if (!HasImageExtension(image))
    {
        LogWarning("Not adding {}, unsupported file type...", image.string());
        return false;
    }

    auto* item{ new QListWidgetItem{ ToQString(image.filename()) } };
    item->setData(Qt::ItemDataRole::UserRole, ToQString(image));
    item->setToolTip(ToQString(image));
    m_List->addItem(item);
    return true;
}

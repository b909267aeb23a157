#pragma once

#include <span>
#include <vector>

#include <QWidget>

#include <igm/util.hpp>

class QListWidget;

// Ordered list of source images, the order is the order of cells in the document
class ImageListWidget : public QWidget
{
    Q_OBJECT

  public:
    ImageListWidget();

    std::vector<fs::path> Images() const;
    size_t ImageCount() const;

  public slots:
    // Files without an image extension are skipped
    void AddImages(std::span<const fs::path> images);
    void AddImage(const fs::path& image);

    void RemoveSelected();
    void Clear();

  signals:
    void ImagesChanged();

  private:
    bool AppendImage(const fs::path& image);

    QListWidget* m_List;
};

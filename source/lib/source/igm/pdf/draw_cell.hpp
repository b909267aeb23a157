#pragma once

#include <igm/image.hpp>
#include <igm/layout/grid_layout.hpp>
#include <igm/util.hpp>

class PdfPage;

// Only cmyk jpegs that need no downsampling are embedded as they are
bool EmbedsOriginalData(EncodedImageView encoded, PixelSize source_size, PixelSize target_size);

/*
        Decodes, converts and draws a single image aspect-fit into its cell

        Any failure on the way, including running out of memory while converting and
        the backend failing to embed the image, is raised as ImageDecodeError for
        image_path so that the caller can skip just this image
*/
void DrawCellImage(PdfPage& page,
                   const fs::path& image_path,
                   const Rect& cell,
                   PixelDensity output_dpi);

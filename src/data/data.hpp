#ifndef PASTICHE_DATA_HPP
#define PASTICHE_DATA_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/image.hpp"
#include "details/folder.hpp"

namespace Pastiche::Data {
    using ImageFolder = Details::ImageFolder;
    using ImageFolderOptions = Details::ImageFolderOptions;
    using LoaderOptions = Details::LoaderOptions;

    using Details::load_image;
    using Details::make_loader;
    using Details::resize_with_crop_or_pad;
    using Details::write_image;
}
#endif //PASTICHE_DATA_HPP

#ifndef STRATA_DATA_LOAD_TYPES_HPP
#define STRATA_DATA_LOAD_TYPES_HPP

#include <cstddef>
#include <string>

namespace Strata::Data::Type {

    struct ImageFolderParameters {
        bool recursive = true;
    };

    // Every supported image below `directory`.
    struct ImageFolder {
        std::string directory;
        ImageFolderParameters parameters{};
    };

    struct ManifestParameters {
        char delimiter = ',';
        std::size_t column = 0;
        std::string root{};  // relative entries resolve here; empty = the manifest's own directory
    };

    // CSV listing image paths in one column. A first row whose cell is not an image path is a header.
    struct Manifest {
        std::string file;
        ManifestParameters parameters{};
    };
}

#endif // STRATA_DATA_LOAD_TYPES_HPP

#include "ContentLoader.h"
#include "Errors.h"
#include "Utils.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace revkit {

std::string DirectoryContentLoader::path_for(const std::string& module_id) const {
    return (fs::path(dir_) / (module_id + extension_)).string();
}

std::string DirectoryContentLoader::load(const std::string& module_id) {
    // Ids come from a validated registry, but never let one climb out of dir_.
    if(module_id.empty() || module_id == "." || module_id == ".." ||
       module_id.find_first_of("/\\") != std::string::npos) {
        throw ContentLoadError(module_id, "id is not a plain file name");
    }
    std::string path = path_for(module_id);
    std::error_code ec;
    if(!fs::is_regular_file(path, ec)) throw ContentLoadError(module_id, "no file at " + path);
    auto text = utils::read_file(path);
    if(!text) throw ContentLoadError(module_id, "cannot read " + path);
    return *text;
}

}

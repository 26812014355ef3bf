#pragma once
#include <string>
#include <memory>

namespace revkit {

// Source of raw module text keyed by module id. Content is opaque.
class ContentLoader {
public:
    virtual ~ContentLoader() = default;
    virtual std::string name() const = 0;
    // Throws ContentLoadError when the module has no content.
    virtual std::string load(const std::string& module_id) = 0;
};

using ContentLoaderPtr = std::unique_ptr<ContentLoader>;

// Reads <dir>/<id><extension>.
class DirectoryContentLoader : public ContentLoader {
public:
    explicit DirectoryContentLoader(std::string dir, std::string extension = ".md")
        : dir_(std::move(dir)), extension_(std::move(extension)) {}
    std::string name() const override { return "directory:" + dir_; }
    std::string load(const std::string& module_id) override;

    std::string path_for(const std::string& module_id) const;

private:
    std::string dir_;
    std::string extension_;
};

}

#pragma once
#include "Module.h"
#include <vector>
#include <string>
#include <unordered_map>
#include <iterator>

namespace revkit {

class ModuleRegistry;

// Lazy view over the modules carrying one tag, in registration order.
// Iteration filters on the fly; begin() may be called any number of times.
class TagView {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Module;
        using difference_type = std::ptrdiff_t;
        using pointer = const Module*;
        using reference = const Module&;

        iterator(const std::vector<Module>* mods, const std::string* tag, size_t pos)
            : mods_(mods), tag_(tag), pos_(pos) { skip(); }
        reference operator*() const { return (*mods_)[pos_]; }
        pointer operator->() const { return &(*mods_)[pos_]; }
        iterator& operator++() { ++pos_; skip(); return *this; }
        iterator operator++(int) { iterator tmp = *this; ++(*this); return tmp; }
        bool operator==(const iterator& o) const { return pos_ == o.pos_ && mods_ == o.mods_; }
        bool operator!=(const iterator& o) const { return !(*this == o); }
    private:
        void skip() { while(pos_ < mods_->size() && !(*mods_)[pos_].has_tag(*tag_)) ++pos_; }
        const std::vector<Module>* mods_;
        const std::string* tag_;
        size_t pos_;
    };

    TagView(const std::vector<Module>& mods, std::string tag) : mods_(&mods), tag_(std::move(tag)) {}
    iterator begin() const { return iterator(mods_, &tag_, 0); }
    iterator end() const { return iterator(mods_, &tag_, mods_->size()); }
    bool empty() const { return begin() == end(); }

private:
    const std::vector<Module>* mods_;
    std::string tag_;
};

class ModuleRegistry {
public:
    void register_module(Module module);
    // Validates dependencies and acyclicity, then freezes the registry.
    void seal();
    bool sealed() const { return sealed_; }

    TagView lookup_by_tag(const std::string& tag) const { return TagView(modules_, tag); }

    const Module* find(const std::string& id) const;
    const Module& at(const std::string& id) const; // throws UnknownModuleError
    bool contains(const std::string& id) const { return index_.count(id) != 0; }
    const std::vector<Module>& modules() const { return modules_; }
    size_t size() const { return modules_.size(); }

private:
    void check_dependencies_known() const;
    void check_acyclic() const;

    std::vector<Module> modules_;
    std::unordered_map<std::string, size_t> index_;
    bool sealed_ = false;
};

}

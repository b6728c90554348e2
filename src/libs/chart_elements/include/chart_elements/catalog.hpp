#pragma once

#include <chart_elements/element.hpp>
#include <chart_elements/element_class.hpp>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace chart_elements {

class UnknownClassError : public std::out_of_range {
public:
    explicit UnknownClassError(const std::string& class_id);
};

class DuplicateClassError : public std::invalid_argument {
public:
    explicit DuplicateClassError(const std::string& class_id);
};

class CatalogFrozenError : public std::logic_error {
public:
    explicit CatalogFrozenError(const std::string& class_id);
};

// Registry of element classes keyed by class id. Written once at startup,
// then frozen and read-only for the rest of the process.
class Catalog {
public:
    Catalog() = default;
    Catalog(const Catalog&) = delete;
    Catalog& operator=(const Catalog&) = delete;

    const ElementClass& register_class(std::unique_ptr<ElementClass> element_class);

    const ElementClass* find(const std::string& class_id) const;
    const ElementClass& get(const std::string& class_id) const;
    const MarkClass& get_mark_class(const std::string& class_id) const;
    const GlyphClass& get_glyph_class(const std::string& class_id) const;
    const ChartClass& get_chart_class(const std::string& class_id) const;

    bool contains(const std::string& class_id) const { return classes_.count(class_id) != 0; }
    std::vector<std::string> class_ids() const;
    std::size_t size() const { return classes_.size(); }

    void freeze() { frozen_ = true; }
    bool is_frozen() const { return frozen_; }

private:
    std::map<std::string, std::unique_ptr<ElementClass>> classes_;
    bool frozen_ = false;
};

// Process-wide catalog.
Catalog& global_catalog();

// Factories. Each runs the class's default-state initializer once.
Mark create_mark(const Catalog& catalog, const std::string& class_id);
// The glyph starts with an anchor mark at index 0.
Glyph create_glyph(const Catalog& catalog, const std::string& class_id, const std::string& table);
Chart create_chart(const Catalog& catalog, const std::string& class_id);

} // namespace chart_elements

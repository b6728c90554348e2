#pragma once

#include <chart_elements/element_class.hpp>
#include <chart_elements/guides.hpp>
#include <chart_model/attribute_map.hpp>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace chart_elements {

class UninitializedElementError : public std::logic_error {
public:
    explicit UninitializedElementError(const std::string& element_id);
};

// Instance state shared by marks, glyphs and charts: identity, class and the
// attribute map. The map is absent until initialize_state() runs.
class Element {
public:
    const std::string& id() const { return id_; }
    const ElementClass& element_class() const { return *class_; }
    const std::string& class_id() const { return class_->class_id(); }

    bool is_initialized() const { return attributes_.has_value(); }
    // Uninitialized -> Initialized. Runs the class's default-state initializer
    // exactly once; a second call throws std::logic_error.
    void initialize_state();

    // Throw UninitializedElementError before initialize_state().
    const chart_model::AttributeMap& attributes() const;
    chart_model::AttributeMap& attributes();

    std::vector<SnappingGuide> alignment_guides() const;
    std::vector<Handle> handles() const;

protected:
    Element(const ElementClass& element_class, std::string id);

    void reassign_id(std::string id) { id_ = std::move(id); }

private:
    std::string id_;
    const ElementClass* class_;
    std::optional<chart_model::AttributeMap> attributes_;
};

class Mark : public Element {
public:
    Mark(const MarkClass& mark_class, std::string id);

    const MarkClass& mark_class() const { return *mark_class_; }

    // Copy with a fresh id.
    Mark clone() const;

private:
    const MarkClass* mark_class_;
};

// A glyph exclusively owns its marks. marks()[0] is the anchor mark.
class Glyph : public Element {
public:
    Glyph(const GlyphClass& glyph_class, std::string id, std::string table);

    const GlyphClass& glyph_class() const { return *glyph_class_; }
    const std::string& table() const { return table_; }

    const std::vector<Mark>& marks() const { return marks_; }
    std::size_t mark_count() const { return marks_.size(); }
    const Mark& mark(std::size_t index) const { return marks_.at(index); }
    Mark& mark(std::size_t index) { return marks_.at(index); }
    Mark& add_mark(Mark mark);

    // Deep copy with fresh ids for the glyph and all of its marks.
    Glyph clone() const;

private:
    const GlyphClass* glyph_class_;
    std::string table_;
    std::vector<Mark> marks_;
};

class Chart : public Element {
public:
    Chart(const ChartClass& chart_class, std::string id);

    const ChartClass& chart_class() const { return *chart_class_; }

    const std::vector<Glyph>& glyphs() const { return glyphs_; }
    std::size_t glyph_count() const { return glyphs_.size(); }
    const Glyph& glyph(std::size_t index) const { return glyphs_.at(index); }
    Glyph& glyph(std::size_t index) { return glyphs_.at(index); }
    Glyph& add_glyph(Glyph glyph);

private:
    const ChartClass* chart_class_;
    std::vector<Glyph> glyphs_;
};

} // namespace chart_elements

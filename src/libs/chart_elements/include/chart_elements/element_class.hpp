#pragma once

#include <chart_elements/guides.hpp>
#include <chart_model/attribute_map.hpp>
#include <chart_model/attributes.hpp>
#include <string>
#include <vector>

namespace chart_elements {

class SolveSession;
class Mark;
class Glyph;
class Chart;

enum class ElementType {
    Mark,
    Glyph,
    Chart
};

const char* to_string(ElementType type);

// One kind of element. Classes are immutable singletons owned by a Catalog and
// shared by every instance of their kind.
class ElementClass {
public:
    virtual ~ElementClass() = default;

    ElementClass(const ElementClass&) = delete;
    ElementClass& operator=(const ElementClass&) = delete;

    const std::string& class_id() const { return class_id_; }
    ElementType element_type() const { return type_; }
    const std::string& display_name() const { return display_name_; }
    const chart_model::AttributeSchema& schema() const { return schema_; }

    // Assigns every schema attribute a value that already satisfies the
    // class's intrinsic constraints.
    virtual void initialize_state(chart_model::AttributeMap& attrs) const = 0;

    virtual std::vector<SnappingGuide> alignment_guides(const chart_model::AttributeMap& attrs) const = 0;
    virtual std::vector<Handle> handles(const chart_model::AttributeMap& attrs) const = 0;

protected:
    ElementClass(std::string class_id, ElementType type, std::string display_name,
        std::vector<chart_model::AttributeDescription> attributes);

private:
    std::string class_id_;
    ElementType type_;
    std::string display_name_;
    chart_model::AttributeSchema schema_;
};

class MarkClass : public ElementClass {
public:
    virtual void build_intrinsic_constraints(SolveSession& session, const Mark& mark) const = 0;

protected:
    MarkClass(std::string class_id, std::string display_name,
        std::vector<chart_model::AttributeDescription> attributes);
};

class GlyphClass : public ElementClass {
public:
    virtual void build_intrinsic_constraints(SolveSession& session, const Glyph& glyph) const = 0;

protected:
    GlyphClass(std::string class_id, std::string display_name,
        std::vector<chart_model::AttributeDescription> attributes);
};

class ChartClass : public ElementClass {
public:
    virtual void build_intrinsic_constraints(SolveSession& session, const Chart& chart) const = 0;

protected:
    ChartClass(std::string class_id, std::string display_name,
        std::vector<chart_model::AttributeDescription> attributes);
};

} // namespace chart_elements

//! # Evaluation Tree
//!
//! A compiled template is an immutable tree of `Template<C>` nodes. Building
//! the tree resolves every name and checks every argument, so rendering has
//! no error path: it walks the tree once per record and writes through a
//! `Formatter`.
//!
//! ## Node Kinds
//!
//! | Node                          | Output                                   |
//! |-------------------------------|------------------------------------------|
//! | `LiteralTemplate`             | fixed text                               |
//! | `ListTemplate`                | children in order                        |
//! | `LabelTemplate`               | child, inside per-render labels          |
//! | `ConditionalTemplate`         | then-branch or optional else-branch      |
//! | `SeparateTemplate`            | non-empty children joined by a separator |
//! | `FormattablePropertyTemplate` | display form of a value                  |
//!
//! `plain_text_property` goes the other way and turns a node into a string
//! extractor.
//!
//! ## Thread Safety
//!
//! Nodes are never mutated after construction. A tree may be rendered from
//! several threads at once, each with its own context and formatter.

#ifndef STENCIL_RENDER_TEMPLATE_HPP
#define STENCIL_RENDER_TEMPLATE_HPP

#include "common.hpp"
#include "render/formatter.hpp"
#include "types/value.hpp"

#include <string>
#include <vector>

namespace stencil::render {

using types::Property;

/// A node of the evaluation tree.
template <typename C> class Template {
public:
    virtual ~Template() = default;

    /// Writes this node's output for `context` to `out`.
    virtual void format(const C& context, Formatter& out) const = 0;
};

/// Shared, immutable handle to a node.
template <typename C> using TemplatePtr = Rc<const Template<C>>;

// ============================================================================
// Nodes
// ============================================================================

template <typename C> class LiteralTemplate : public Template<C> {
public:
    explicit LiteralTemplate(std::string text) : text_(std::move(text)) {}

    void format(const C&, Formatter& out) const override {
        out.write_str(text_);
    }

private:
    std::string text_;
};

template <typename C> class ListTemplate : public Template<C> {
public:
    explicit ListTemplate(std::vector<TemplatePtr<C>> items) : items_(std::move(items)) {}

    void format(const C& context, Formatter& out) const override {
        for (const auto& item : items_) {
            item->format(context, out);
        }
    }

private:
    std::vector<TemplatePtr<C>> items_;
};

/// Renders `content` inside the labels computed for each record.
template <typename C> class LabelTemplate : public Template<C> {
public:
    LabelTemplate(TemplatePtr<C> content, Property<C, std::vector<std::string>> labels)
        : content_(std::move(content)), labels_(std::move(labels)) {}

    void format(const C& context, Formatter& out) const override {
        auto labels = labels_(context);
        for (const auto& label : labels) {
            out.push_label(label);
        }
        content_->format(context, out);
        for (size_t i = 0; i < labels.size(); ++i) {
            out.pop_label();
        }
    }

private:
    TemplatePtr<C> content_;
    Property<C, std::vector<std::string>> labels_;
};

template <typename C> class ConditionalTemplate : public Template<C> {
public:
    /// `false_template` may be null.
    ConditionalTemplate(Property<C, bool> condition, TemplatePtr<C> true_template,
                        TemplatePtr<C> false_template)
        : condition_(std::move(condition)), true_template_(std::move(true_template)),
          false_template_(std::move(false_template)) {}

    void format(const C& context, Formatter& out) const override {
        if (condition_(context)) {
            true_template_->format(context, out);
        } else if (false_template_) {
            false_template_->format(context, out);
        }
    }

private:
    Property<C, bool> condition_;
    TemplatePtr<C> true_template_;
    TemplatePtr<C> false_template_;
};

/// Joins the non-empty contents with `separator`.
///
/// Each content is rendered into a buffer first; empty ones are dropped, so
/// the output never has leading, trailing or doubled separators.
template <typename C> class SeparateTemplate : public Template<C> {
public:
    SeparateTemplate(TemplatePtr<C> separator, std::vector<TemplatePtr<C>> contents)
        : separator_(std::move(separator)), contents_(std::move(contents)) {}

    void format(const C& context, Formatter& out) const override {
        bool first = true;
        for (const auto& content : contents_) {
            FormatRecorder recorder;
            content->format(context, recorder);
            if (recorder.empty()) {
                continue;
            }
            if (!first) {
                separator_->format(context, out);
            }
            recorder.replay(out);
            first = false;
        }
    }

private:
    TemplatePtr<C> separator_;
    std::vector<TemplatePtr<C>> contents_;
};

/// Writes the display form of a value.
template <typename C, typename T> class FormattablePropertyTemplate : public Template<C> {
public:
    explicit FormattablePropertyTemplate(Property<C, T> property)
        : property_(std::move(property)) {}

    void format(const C& context, Formatter& out) const override {
        write_value(out, property_(context));
    }

private:
    Property<C, T> property_;
};

// ============================================================================
// Rendering
// ============================================================================

/// Streams the output of `tmpl` into any formatter.
template <typename C> void render_to(const Template<C>& tmpl, const C& context, Formatter& out) {
    tmpl.format(context, out);
}

/// Renders into labeled segments.
template <typename C>
[[nodiscard]] auto render(const Template<C>& tmpl, const C& context) -> StyledText {
    FormatRecorder recorder;
    tmpl.format(context, recorder);
    return recorder.take_styled_text();
}

/// Renders text only, dropping labels.
template <typename C>
[[nodiscard]] auto render_plain(const Template<C>& tmpl, const C& context) -> std::string {
    PlainTextFormatter formatter;
    tmpl.format(context, formatter);
    return formatter.take_text();
}

/// A string extractor that renders `tmpl` and keeps only its text.
template <typename C>
[[nodiscard]] auto plain_text_property(TemplatePtr<C> tmpl) -> Property<C, std::string> {
    return [tmpl = std::move(tmpl)](const C& context) { return render_plain(*tmpl, context); };
}

} // namespace stencil::render

#endif // STENCIL_RENDER_TEMPLATE_HPP

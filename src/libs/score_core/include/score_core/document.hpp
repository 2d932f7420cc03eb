#pragma once

#include <score_core/page.hpp>
#include <score_core/paper.hpp>
#include <cstddef>
#include <memory>
#include <vector>

namespace score_core {

class Flowable;

// Hands out pages by index, creating them when layout runs past the last one.
class PageSupplier {
public:
    virtual ~PageSupplier() = default;
    virtual Page& page(std::size_t index) = 0;
};

// Owns the pages (the tree roots) and runs render passes over them.
class Document : public PageSupplier {
public:
    explicit Document(const Paper& paper = Paper::letter(),
        score_units::Unit page_gap = score_units::mm(50));
    ~Document() override;

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    Page& page(std::size_t index) override;
    std::size_t page_count() const { return pages_.size(); }
    const std::vector<std::unique_ptr<Page>>& pages() const { return pages_; }

    const Paper& paper() const { return paper_; }
    // Moves every page to the new geometry and drops all line layouts.
    void set_paper(const Paper& paper);
    score_units::Unit page_gap() const { return page_gap_; }

    // Document-space position of a page's live-area origin.
    score_units::Point page_origin(std::size_t index) const;

    // Marks every flowable's line layout as stale.
    void invalidate_layouts();

    std::vector<Flowable*> flowables();

    // One full layout + render cycle. Throws LayoutError when a flowable cannot
    // be broken; caches are cleared whether or not the pass succeeds. Empty
    // trailing pages no line reaches are dropped.
    void render(RenderSink& sink, bool page_previews = false);

private:
    static PageSide side_for_index(std::size_t index);
    void pre_render();
    // Drops trailing pages that hold nothing and that no line reaches.
    void trim_unused_pages();
    void render_tree(Page& page, RenderSink& sink);

    Paper paper_;
    score_units::Unit page_gap_;
    std::vector<std::unique_ptr<Page>> pages_;
};

} // namespace score_core

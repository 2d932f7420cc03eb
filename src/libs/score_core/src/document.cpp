#include <score_core/document.hpp>
#include <score_core/errors.hpp>
#include <score_core/flowable.hpp>
#include <score_core/log.hpp>
#include <score_core/mapping.hpp>
#include <score_core/render_sink.hpp>
#include <algorithm>

namespace score_core {

namespace {

// Runs the post-render hooks however the pass ends.
class PostRenderGuard {
public:
    explicit PostRenderGuard(std::vector<std::unique_ptr<Page>>& pages) : pages_(pages) {}
    ~PostRenderGuard() {
        for (auto& page : pages_) {
            page->post_render_hook();
            page->for_each_descendant([](PositionedObject& node) { node.post_render_hook(); });
        }
    }

    PostRenderGuard(const PostRenderGuard&) = delete;
    PostRenderGuard& operator=(const PostRenderGuard&) = delete;

private:
    std::vector<std::unique_ptr<Page>>& pages_;
};

} // namespace

Document::Document(const Paper& paper, score_units::Unit page_gap)
    : paper_(paper), page_gap_(page_gap) {}

Document::~Document() = default;

PageSide Document::side_for_index(std::size_t index) {
    return index % 2 == 0 ? PageSide::Right : PageSide::Left;
}

score_units::Point Document::page_origin(std::size_t index) const {
    const PageSide side = side_for_index(index);
    const score_units::Unit margin_left = side == PageSide::Right
        ? paper_.margin_left + paper_.gutter
        : paper_.margin_left;
    const score_units::Unit page_x = (paper_.width + page_gap_) * static_cast<double>(index);
    return score_units::Point{page_x + margin_left, paper_.margin_top};
}

Page& Document::page(std::size_t index) {
    while (pages_.size() <= index) {
        const std::size_t next = pages_.size();
        pages_.push_back(std::make_unique<Page>(page_origin(next), next, side_for_index(next),
            paper_, this));
        layout_logger()->debug("page_created index={}", next);
    }
    return *pages_[index];
}

void Document::set_paper(const Paper& paper) {
    paper_ = paper;
    for (auto& page : pages_) {
        page->set_paper(paper_);
        page->set_pos(page_origin(page->index()));
    }
    invalidate_layouts();
}

void Document::invalidate_layouts() {
    for (Flowable* flowable : flowables())
        flowable->invalidate_layout();
}

std::vector<Flowable*> Document::flowables() {
    std::vector<Flowable*> out;
    for (auto& page : pages_) {
        page->for_each_descendant([&](PositionedObject& node) {
            if (node.kind() == ObjectKind::Flowable) out.push_back(static_cast<Flowable*>(&node));
        });
    }
    return out;
}

void Document::pre_render() {
    for (auto& page : pages_) {
        page->pre_render_hook();
        page->for_each_descendant([](PositionedObject& node) { node.pre_render_hook(); });
    }
}

void Document::trim_unused_pages() {
    std::size_t needed = 1;
    for (Flowable* flowable : flowables())
        needed = std::max(needed, flowable->lines().back().page_index + 1);

    const std::size_t before = pages_.size();
    while (pages_.size() > needed && pages_.back()->children().empty())
        pages_.pop_back();
    if (pages_.size() != before)
        layout_logger()->debug("pages_trimmed from={} to={}", before, pages_.size());
}

void Document::render_tree(Page& page, RenderSink& sink) {
    page.for_each_descendant([&](PositionedObject& node) {
        if (const Flowable* flowable = enclosing_flowable(node)) {
            flowable->render_object(node, sink);
            return;
        }
        node.render_complete(sink, map_to_document(node), nullptr, score_units::zero);
    });
}

void Document::render(RenderSink& sink, bool page_previews) {
    auto logger = layout_logger();
    PostRenderGuard guard(pages_);

    pre_render();
    try {
        for (Flowable* flowable : flowables())
            flowable->lines();
    } catch (const LayoutError& e) {
        logger->error("layout_pass_failed reason={}", e.what());
        throw;
    }
    trim_unused_pages();

    // Breaking may have added pages; index so new ones are included.
    for (std::size_t i = 0; i < pages_.size(); ++i) {
        if (page_previews) pages_[i]->render_geometry_preview(sink);
        render_tree(*pages_[i], sink);
    }
    logger->debug("render_pass_finished pages={}", pages_.size());
}

} // namespace score_core

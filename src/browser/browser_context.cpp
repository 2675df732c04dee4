#include "browser_context.hpp"
#include "../core/errors/errors.hpp"
#include "browser.hpp"

namespace Tether {
namespace Browser {

BrowserContext::BrowserContext(std::weak_ptr<Browser> browser, std::optional<std::string> id)
    : browser_(std::move(browser)), id_(std::move(id)) {
    if (id_ && id_->empty())
        id_.reset();
}

std::shared_ptr<Browser> BrowserContext::browser() const {
    auto browser = browser_.lock();
    if (!browser)
        throw Core::PreconditionError("Browser context " + id_.value_or("default")
                                      + " outlived its browser");
    return browser;
}

std::vector<std::shared_ptr<Target>> BrowserContext::targets() const {
    std::vector<std::shared_ptr<Target>> result;
    auto browser = browser_.lock();
    if (!browser)
        return result;
    for (const auto& target : browser->targets()) {
        if (target->browser_context().get() == this)
            result.push_back(target);
    }
    return result;
}

std::vector<std::shared_ptr<Target::PageCell>> BrowserContext::start_pages() const {
    std::vector<std::shared_ptr<Target::PageCell>> cells;
    for (const auto& target : targets()) {
        if (auto cell = target->ensure_page())
            cells.push_back(std::move(cell));
    }
    return cells;
}

boost::asio::awaitable<std::vector<std::shared_ptr<Page>>>
BrowserContext::collect_pages(std::vector<std::shared_ptr<Target::PageCell>> cells) {
    std::vector<std::shared_ptr<Page>> pages;
    for (const auto& cell : cells) {
        auto page = co_await cell->get();
        if (page)
            pages.push_back(std::move(page));
    }
    co_return pages;
}

boost::asio::awaitable<std::vector<std::shared_ptr<Page>>> BrowserContext::pages() {
    co_return co_await collect_pages(start_pages());
}

boost::asio::awaitable<std::shared_ptr<Target>>
BrowserContext::wait_for_target(TargetPredicate predicate, WaitForTargetOptions options) {
    const BrowserContext* self = this;
    co_return co_await browser()->wait_for_target(
        [self, predicate = std::move(predicate)](const Target& target) {
            return target.browser_context().get() == self && predicate(target);
        },
        options);
}

boost::asio::awaitable<std::shared_ptr<Page>> BrowserContext::new_page() {
    co_return co_await browser()->create_page_in_context(id_);
}

boost::asio::awaitable<void> BrowserContext::close() {
    if (!id_)
        throw Core::PreconditionError("Non-incognito profiles cannot be closed!");
    co_await browser()->dispose_context(*id_);
}

}  // namespace Browser
}  // namespace Tether

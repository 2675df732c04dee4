#include "target.hpp"
#include "../core/types/constants.hpp"

namespace Tether {
namespace Browser {

Target::Target(const Protocol::TargetInfo&     info,
               std::shared_ptr<BrowserContext> context,
               boost::asio::any_io_executor    executor,
               PageMaterializer                materializer)
    : target_id_(info.target_id),
      type_(info.type),
      url_(info.url),
      context_(std::move(context)),
      executor_(std::move(executor)),
      materializer_(std::move(materializer)) {
}

bool Target::is_page() const {
    return type_ == Core::Constants::PAGE_TARGET_TYPE;
}

std::shared_ptr<Target::PageCell> Target::ensure_page() {
    if (!is_page())
        return nullptr;
    if (!page_cell_) {
        page_cell_ = PageCell::create(executor_);
        auto self  = shared_from_this();
        page_cell_->start([self]() { return self->materializer_(self); });
    }
    return page_cell_;
}

boost::asio::awaitable<std::shared_ptr<Page>> Target::page() {
    auto cell = ensure_page();
    if (!cell)
        co_return nullptr;
    co_return co_await cell->get();
}

void Target::closed_callback() {
    if (is_closed_)
        return;
    is_closed_ = true;
    closed_.emit();
    closed_.clear();
}

}  // namespace Browser
}  // namespace Tether

#include "filter_chain.h"

#include <kj/debug.h>

namespace tollgate::gateway {

void AccessFilterChain::add(kj::Own<Middleware> stage) {
  stages_.add(kj::mv(stage));
}

kj::Vector<kj::StringPtr> AccessFilterChain::stageNames() const {
  kj::Vector<kj::StringPtr> names;
  for (auto& stage : stages_) {
    names.add(stage->name());
  }
  return names;
}

kj::Promise<FilterOutcome> AccessFilterChain::run(RequestContext& ctx) {
  for (auto& stage : stages_) {
    ++ctx.stagesEntered;
    auto outcome = co_await kj::evalNow([&]() { return stage->process(ctx); })
                       .catch_([](kj::Exception&& e) -> FilterOutcome { return Fail{kj::mv(e)}; });
    if (!outcome.is<Continue>()) {
      co_return kj::mv(outcome);
    }
  }
  co_return FilterOutcome(Continue{});
}

void AccessFilterChain::finish(RequestContext& ctx, kj::Maybe<const kj::Exception&> error) {
  size_t entered = kj::min(ctx.stagesEntered, stages_.size());
  for (size_t i = entered; i > 0; --i) {
    auto& stage = *stages_[i - 1];
    auto failure = kj::runCatchingExceptions([&]() { stage.finish(ctx, error); });
    KJ_IF_SOME(exception, failure) {
      logger_.error("Filter stage failed while finishing request",
                    {core::kv("stage", stage.name()),
                     core::kv("error", exception.getDescription())});
    }
  }
}

} // namespace tollgate::gateway

#include "context.h"
#include "../logger.h"

#include <stdexcept>

namespace qb::apidoc {

namespace {
thread_local GenContext *t_current = nullptr;
} // anonymous namespace

void GenContext::error(Error err) {
    LOG_APIDOC_WARN("documentation error - " << err);
    if (const auto &hook = _options.error_hook()) {
        hook(err);
    }
    _errors.push_back(std::move(err));
}

GenContext &GenContext::current() {
    if (!t_current) {
        throw std::logic_error("GenContext::current: no generation scope is active on this thread.");
    }
    return *t_current;
}

bool GenContext::has_current() noexcept {
    return t_current != nullptr;
}

GenScope::GenScope(GenContext &ctx) : _ctx(&ctx) {
    if (t_current) {
        throw std::logic_error("GenScope: a generation scope is already active on this thread.");
    }
    t_current = _ctx;
    LOG_APIDOC_DEBUG("generation scope opened");
}

GenScope::~GenScope() {
    t_current = nullptr;
    LOG_APIDOC_DEBUG("generation scope closed with " << _ctx->errors().size() << " error(s)");
}

} // namespace qb::apidoc

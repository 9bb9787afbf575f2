#include "operation_io.h"
#include "../logger.h"

namespace qb::apidoc {

void add_parameters(GenContext &ctx, openapi::Operation &op, std::vector<qb::json> parameters) {
    for (auto &p : parameters) {
        std::string name = p.value("name", "");
        std::string in = p.value("in", "");
        if (!op.add_parameter(std::move(p))) {
            ctx.error(Error::duplicate_parameter(name, in));
        }
    }
}

void set_request_body(GenContext &ctx, openapi::Operation &op, qb::json body) {
    if (!op.set_request_body(std::move(body))) {
        ctx.error(Error::duplicate_request_body());
    }
}

void set_inferred_response(GenContext &ctx, openapi::Operation &op, const OutcomeKey &key,
                           openapi::Response response, openapi::ResponseSource source) {
    auto result = op.responses.insert_inferred(key, std::move(response), source);
    if (result.conflict) {
        ctx.error(std::move(*result.conflict));
    } else if (result.replaced) {
        LOG_APIDOC_TRACE("early response overrides inferred response " << key.to_string());
    }
}

void infer_operation(GenContext &ctx, openapi::Operation &op,
                     const IOperationInput &input, const IOperationOutput &output) {
    input.operation_input(ctx, op);

    if (!ctx.infer_responses()) {
        return;
    }

    for (auto &[key, res] : output.inferred_responses(ctx, op)) {
        set_inferred_response(ctx, op, key, std::move(res), openapi::ResponseSource::Output);
    }

    // Early responses go last so they can override what the output claimed.
    for (auto &[key, res] : input.inferred_early_responses(ctx, op)) {
        set_inferred_response(ctx, op, key, std::move(res), openapi::ResponseSource::Early);
    }
}

} // namespace qb::apidoc

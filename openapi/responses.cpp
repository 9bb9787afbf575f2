#include "responses.h"

namespace qb::apidoc::openapi {

const Responses::Entry *Responses::entry(const OutcomeKey &key) const {
    if (key.is_default()) {
        return _default ? &*_default : nullptr;
    }
    auto it = _responses.find(*key.code());
    return it != _responses.end() ? &it->second : nullptr;
}

InsertResult Responses::insert_inferred(const OutcomeKey &key, Response response, ResponseSource source) {
    InsertResult result;

    Entry *existing = nullptr;
    if (key.is_default()) {
        existing = _default ? &*_default : nullptr;
    } else {
        auto it = _responses.find(*key.code());
        existing = it != _responses.end() ? &it->second : nullptr;
    }

    if (!existing) {
        Entry fresh{std::move(response), source};
        if (key.is_default()) {
            _default = std::move(fresh);
        } else {
            _responses.emplace(*key.code(), std::move(fresh));
        }
        result.inserted = true;
        return result;
    }

    // early over output, never the other way round
    if (existing->source == ResponseSource::Output && source == ResponseSource::Early) {
        *existing = Entry{std::move(response), source};
        result.inserted = true;
        result.replaced = true;
        return result;
    }

    result.conflict = key.is_default() ? Error::inferred_default_response_conflict()
                                       : Error::inferred_response_conflict(*key.code());
    return result;
}

void Responses::set(const OutcomeKey &key, Response response) {
    Entry fresh{std::move(response), ResponseSource::Explicit};
    if (key.is_default()) {
        _default = std::move(fresh);
    } else {
        _responses.insert_or_assign(*key.code(), std::move(fresh));
    }
}

bool Responses::remove(const OutcomeKey &key) {
    if (key.is_default()) {
        bool had = _default.has_value();
        _default.reset();
        return had;
    }
    return _responses.erase(*key.code()) > 0;
}

const Response *Responses::find(const OutcomeKey &key) const {
    const Entry *e = entry(key);
    return e ? &e->response : nullptr;
}

std::optional<ResponseSource> Responses::source(const OutcomeKey &key) const {
    const Entry *e = entry(key);
    if (!e) {
        return std::nullopt;
    }
    return e->source;
}

std::vector<uint16_t> Responses::status_codes() const {
    std::vector<uint16_t> codes;
    codes.reserve(_responses.size());
    for (const auto &[code, _] : _responses) {
        codes.push_back(code);
    }
    return codes;
}

qb::json Responses::to_json() const {
    qb::json out = qb::json::object();
    for (const auto &[code, e] : _responses) {
        out[std::to_string(code)] = e.response.to_json();
    }
    if (_default) {
        out["default"] = _default->response.to_json();
    }
    return out;
}

} // namespace qb::apidoc::openapi

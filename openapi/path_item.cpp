#include "path_item.h"

#include <stdexcept>

namespace qb::apidoc::openapi {

namespace {

std::size_t slot_index(Method m) {
    if (!is_known_method(m)) {
        throw std::logic_error("PathItem: method value " +
                               std::to_string(static_cast<int>(m)) +
                               " is outside the documented method set.");
    }
    return static_cast<std::size_t>(m);
}

} // anonymous namespace

std::optional<Operation> &PathItem::slot(Method m) {
    return _operations[slot_index(m)];
}

const std::optional<Operation> &PathItem::slot(Method m) const {
    return _operations[slot_index(m)];
}

void PathItem::set(Method m, Operation op) {
    slot(m) = std::move(op);
}

bool PathItem::erase(Method m) {
    auto &s = slot(m);
    if (!s) {
        return false;
    }
    s.reset();
    return true;
}

const Operation *PathItem::get(Method m) const {
    const auto &s = slot(m);
    return s ? &*s : nullptr;
}

bool PathItem::empty() const noexcept {
    return size() == 0;
}

std::size_t PathItem::size() const noexcept {
    std::size_t n = 0;
    for (const auto &op : _operations) {
        if (op) {
            ++n;
        }
    }
    return n;
}

std::size_t PathItem::merge(PathItem &&other) {
    std::size_t overwritten = 0;
    for (Method m : CANONICAL_METHODS) {
        auto &theirs = other.slot(m);
        if (!theirs) {
            continue;
        }
        auto &ours = slot(m);
        if (ours) {
            ++overwritten;
        }
        ours = std::move(theirs);
        theirs.reset();
    }

    if (summary.empty()) {
        summary = std::move(other.summary);
    }
    if (description.empty()) {
        description = std::move(other.description);
    }
    for (auto &p : other.parameters) {
        parameters.push_back(std::move(p));
    }
    other.parameters = qb::json::array();
    return overwritten;
}

qb::json PathItem::to_json() const {
    qb::json item = qb::json::object();

    if (!summary.empty()) {
        item["summary"] = summary;
    }
    if (!description.empty()) {
        item["description"] = description;
    }
    for (Method m : CANONICAL_METHODS) {
        if (const auto &op = slot(m)) {
            item[method_key(m)] = op->to_json();
        }
    }
    if (!parameters.empty()) {
        item["parameters"] = parameters;
    }
    return item;
}

} // namespace qb::apidoc::openapi

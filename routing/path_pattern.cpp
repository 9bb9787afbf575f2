#include "path_pattern.h"

#include <stdexcept>

namespace qb::apidoc {

std::vector<std::string_view> split_path(std::string_view path) {
    std::vector<std::string_view> segments;
    std::size_t pos = 0;
    while (pos <= path.size()) {
        std::size_t next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        if (next > pos) {
            segments.push_back(path.substr(pos, next - pos));
        }
        pos = next + 1;
    }
    return segments;
}

PathPattern::PathPattern(std::string_view pattern) {
    for (auto seg : split_path(pattern)) {
        std::string_view name;
        if (seg.front() == ':') {
            name = seg.substr(1);
        } else if (seg.size() >= 2 && seg.front() == '{' && seg.back() == '}') {
            name = seg.substr(1, seg.size() - 2);
        } else {
            _segments.push_back({SegmentType::STATIC, std::string(seg)});
            continue;
        }
        if (name.empty()) {
            throw std::invalid_argument("PathPattern: parameter segment without a name in '" +
                                        std::string(pattern) + "'.");
        }
        _segments.push_back({SegmentType::PARAMETER, std::string(name)});
    }
}

std::vector<std::string> PathPattern::parameter_names() const {
    std::vector<std::string> names;
    for (const auto &seg : _segments) {
        if (seg.type == SegmentType::PARAMETER) {
            names.push_back(seg.text);
        }
    }
    return names;
}

std::size_t PathPattern::parameter_count() const noexcept {
    std::size_t n = 0;
    for (const auto &seg : _segments) {
        n += seg.type == SegmentType::PARAMETER;
    }
    return n;
}

bool PathPattern::match(std::string_view path, http::FieldMap &params) const {
    auto parts = split_path(path);
    if (parts.size() != _segments.size()) {
        return false;
    }

    http::FieldMap captured;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto &seg = _segments[i];
        if (seg.type == SegmentType::STATIC) {
            if (parts[i] != seg.text) {
                return false;
            }
        } else {
            captured[seg.text] = std::string(parts[i]);
        }
    }

    for (auto &[name, value] : captured) {
        params[name] = std::move(value);
    }
    return true;
}

std::string PathPattern::openapi_path() const {
    if (_segments.empty()) {
        return "/";
    }
    std::string out;
    for (const auto &seg : _segments) {
        out += '/';
        if (seg.type == SegmentType::PARAMETER) {
            out += '{' + seg.text + '}';
        } else {
            out += seg.text;
        }
    }
    return out;
}

bool PathPattern::operator==(const PathPattern &rhs) const {
    if (_segments.size() != rhs._segments.size()) {
        return false;
    }
    for (std::size_t i = 0; i < _segments.size(); ++i) {
        const auto &a = _segments[i];
        const auto &b = rhs._segments[i];
        if (a.type != b.type || a.text != b.text) {
            return false;
        }
    }
    return true;
}

} // namespace qb::apidoc

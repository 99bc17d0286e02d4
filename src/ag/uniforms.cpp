#include "kestrel/ag/uniforms.hpp"
#include "kestrel/ag/ag.hpp"

#include <algorithm>
#include <sstream>
#include <type_traits>

namespace kestrel {

std::vector<std::pair<Uniform, AGUniformValue>>::iterator AGUniformValues::find(const Uniform& uniform) {
    return std::find_if(entries_.begin(), entries_.end(),
        [&](const auto& entry) { return entry.first == uniform; });
}

std::vector<std::pair<Uniform, AGUniformValue>>::const_iterator AGUniformValues::find(const Uniform& uniform) const {
    return std::find_if(entries_.begin(), entries_.end(),
        [&](const auto& entry) { return entry.first == uniform; });
}

AGUniformValue& AGUniformValues::operator[](const Uniform& uniform) {
    auto it = find(uniform);
    if (it != entries_.end()) {
        return it->second;
    }
    entries_.emplace_back(uniform, AGUniformValue{});
    return entries_.back().second;
}

void AGUniformValues::set(const Uniform& uniform, AGUniformValue value) {
    (*this)[uniform] = std::move(value);
}

std::optional<AGUniformValue> AGUniformValues::get(const Uniform& uniform) const {
    auto it = find(uniform);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool AGUniformValues::contains(const Uniform& uniform) const {
    return find(uniform) != entries_.end();
}

bool AGUniformValues::remove(const Uniform& uniform) {
    auto it = find(uniform);
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

AGUniformValues& AGUniformValues::setTo(const AGUniformValues& other) {
    if (this != &other) {
        entries_ = other.entries_;
    }
    return *this;
}

AGUniformValues& AGUniformValues::put(const AGUniformValues& other) {
    if (this == &other) {
        return *this;
    }
    for (const auto& [uniform, value] : other.entries_) {
        set(uniform, value);
    }
    return *this;
}

AGTexture* AGUniformValues::firstTexture() const {
    for (const auto& entry : entries_) {
        if (auto unit = std::get_if<AGTextureUnit>(&entry.second)) {
            return unit->texture;
        }
    }
    return nullptr;
}

std::string AGUniformValues::toString() const {
    std::string out = "{";
    bool first = true;
    for (const auto& [uniform, value] : entries_) {
        if (!first) {
            out += ", ";
        }
        first = false;
        out += uniform.name + "=" + uniformValueToString(value);
    }
    return out + "}";
}

std::string uniformValueToString(const AGUniformValue& value) {
    std::ostringstream ss;
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            ss << "null";
        } else if constexpr (std::is_same_v<T, float>) {
            ss << v;
        } else if constexpr (std::is_same_v<T, glm::vec2>) {
            ss << "vec2(" << v.x << ", " << v.y << ")";
        } else if constexpr (std::is_same_v<T, glm::vec4>) {
            ss << "vec4(" << v.x << ", " << v.y << ", " << v.z << ", " << v.w << ")";
        } else if constexpr (std::is_same_v<T, glm::mat4>) {
            ss << "mat4[";
            for (int col = 0; col < 4; col++) {
                for (int row = 0; row < 4; row++) {
                    ss << v[col][row] << ((col == 3 && row == 3) ? "" : ",");
                }
            }
            ss << "]";
        } else if constexpr (std::is_same_v<T, AGTextureUnit>) {
            if (v.texture) {
                ss << "Texture[" << v.texture->id() << "]";
            } else {
                ss << "Texture[none]";
            }
        }
    }, value);
    return ss.str();
}

} // namespace kestrel

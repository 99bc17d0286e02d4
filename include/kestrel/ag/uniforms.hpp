#pragma once

#include <glm/glm.hpp>

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace kestrel {

class AGTexture;

enum class VarType {
    Float1,
    Float2,
    Float4,
    Mat4,
    Sampler2D
};

/**
 * @brief Shader uniform declaration, identified by name
 */
struct Uniform {
    std::string name;
    VarType type = VarType::Float1;

    Uniform() = default;
    Uniform(std::string name_, VarType type_) : name(std::move(name_)), type(type_) {}

    bool operator==(const Uniform& other) const { return name == other.name; }
    bool operator!=(const Uniform& other) const { return name != other.name; }
};

/// Texture bound to a sampler uniform
struct AGTextureUnit {
    AGTexture* texture = nullptr;
    bool linear = true;

    bool operator==(const AGTextureUnit& other) const {
        return texture == other.texture && linear == other.linear;
    }
};

using AGUniformValue = std::variant<std::monostate, float, glm::vec2, glm::vec4, glm::mat4, AGTextureUnit>;

/**
 * @brief Ordered set of uniform values
 *
 * Insertion order is kept so backends (and LogAG output) see uniforms in a
 * stable order.
 */
class AGUniformValues {
public:
    AGUniformValues() = default;

    /// Access a value, inserting an empty one if missing
    AGUniformValue& operator[](const Uniform& uniform);

    void set(const Uniform& uniform, AGUniformValue value);

    /// Current value, or std::nullopt if the uniform was never set
    std::optional<AGUniformValue> get(const Uniform& uniform) const;

    bool contains(const Uniform& uniform) const;

    /// Remove a uniform; returns false if it was not present
    bool remove(const Uniform& uniform);

    /// Replace all values with those of @p other
    AGUniformValues& setTo(const AGUniformValues& other);

    /// Merge @p other into this, overwriting existing values
    AGUniformValues& put(const AGUniformValues& other);

    bool isEmpty() const { return entries_.empty(); }
    bool isNotEmpty() const { return !entries_.empty(); }
    size_t size() const { return entries_.size(); }
    void clear() { entries_.clear(); }

    const std::vector<std::pair<Uniform, AGUniformValue>>& entries() const { return entries_; }

    /// First texture bound in these values, or nullptr
    AGTexture* firstTexture() const;

    std::string toString() const;

private:
    std::vector<std::pair<Uniform, AGUniformValue>>::iterator find(const Uniform& uniform);
    std::vector<std::pair<Uniform, AGUniformValue>>::const_iterator find(const Uniform& uniform) const;

    std::vector<std::pair<Uniform, AGUniformValue>> entries_;
};

/// Human readable form of a uniform value
std::string uniformValueToString(const AGUniformValue& value);

} // namespace kestrel

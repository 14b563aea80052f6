#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace semgraph {

// Datatype tag stored in the top 4 bits of a ValueId
enum class Datatype : uint8_t {
    Undefined = 0,
    VocabIndex = 4,        // Term interned in the generation vocabulary
    LocalVocabIndex = 5,   // Term created during one query (BIND, CONCAT, ...)
    MaxValue = LocalVocabIndex
};

constexpr std::string_view toString(Datatype type) {
    switch (type) {
        case Datatype::Undefined: return "Undefined";
        case Datatype::VocabIndex: return "VocabIndex";
        case Datatype::LocalVocabIndex: return "LocalVocabIndex";
    }
    return "Unknown";
}

// ValueId: 64-bit encoded term reference with 4 bits for type, 60 bits for index.
// Bit pattern 0 is the undefined (unbound) value.
class ValueId {
public:
    using T = uint64_t;
    static constexpr T numDatatypeBits = 4;
    static constexpr T numDataBits = 64 - numDatatypeBits;

    static constexpr T maxIndex = (1ull << numDataBits) - 1;

private:
    T _bits = 0;

public:
    ValueId() = default;

    constexpr T getBits() const noexcept { return _bits; }

    static constexpr ValueId fromBits(T bits) noexcept { return ValueId(bits); }

    constexpr Datatype getDatatype() const noexcept {
        return static_cast<Datatype>(_bits >> numDataBits);
    }

    static constexpr ValueId makeUndefined() noexcept { return ValueId(0); }
    constexpr bool isUndefined() const noexcept { return _bits == 0; }

    static ValueId makeFromVocabIndex(uint64_t index) {
        return makeFromIndex(index, Datatype::VocabIndex);
    }

    static ValueId makeFromLocalVocabIndex(uint64_t index) {
        return makeFromIndex(index, Datatype::LocalVocabIndex);
    }

    constexpr uint64_t getIndex() const noexcept { return removeDatatypeBits(_bits); }

    constexpr bool isVocabIndex() const noexcept {
        return getDatatype() == Datatype::VocabIndex;
    }
    constexpr bool isLocalVocabIndex() const noexcept {
        return getDatatype() == Datatype::LocalVocabIndex;
    }

    bool operator==(const ValueId& other) const noexcept { return _bits == other._bits; }
    bool operator!=(const ValueId& other) const noexcept { return _bits != other._bits; }
    bool operator<(const ValueId& other) const noexcept { return _bits < other._bits; }
    bool operator<=(const ValueId& other) const noexcept { return _bits <= other._bits; }
    bool operator>(const ValueId& other) const noexcept { return _bits > other._bits; }
    bool operator>=(const ValueId& other) const noexcept { return _bits >= other._bits; }

    std::string ToString() const {
        return std::string(toString(getDatatype())) + ":" + std::to_string(getIndex());
    }

private:
    constexpr explicit ValueId(T bits) : _bits(bits) {}

    static constexpr ValueId addDatatypeBits(T bits, Datatype type) noexcept {
        T mask = static_cast<T>(type) << numDataBits;
        return ValueId(bits | mask);
    }

    static constexpr T removeDatatypeBits(T bits) noexcept {
        T mask = (1ull << numDataBits) - 1;
        return bits & mask;
    }

    static ValueId makeFromIndex(T id, Datatype type) {
        if (id > maxIndex) {
            throw std::overflow_error("Index value exceeds 60-bit maximum");
        }
        return addDatatypeBits(id, type);
    }
};

} // namespace semgraph

namespace std {
template <>
struct hash<semgraph::ValueId> {
    size_t operator()(const semgraph::ValueId& id) const noexcept {
        return std::hash<uint64_t>()(id.getBits());
    }
};
} // namespace std

/*
 * ubin
 * Copyright (c) 2026 h8
 * Licensed under the MIT License.
 * See LICENSE file in the project root for full license information.
 */

// ReSharper disable CppClangTidyCppcoreguidelinesAvoidConstOrRefDataMembers
// ReSharper disable CppClangTidyBugproneBitwisePointerCast

#ifndef UBIN_HPP
#define UBIN_HPP

#pragma once
#include <algorithm>
#include <array>
#include <bit>
#include <cassert>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <cstdlib>
#if defined(_MSC_VER)
    #include <malloc.h>
#endif

#ifdef _MSC_VER
    #define UBIN_FORCEINLINE __forceinline
#else
    #define UBIN_FORCEINLINE __attribute__((always_inline)) inline
#endif

namespace ubin {
    class Arena;
}

namespace ubin::detail {

    [[nodiscard]] UBIN_FORCEINLINE constexpr bool is_cont(const unsigned char c) noexcept {
        return (c & 0xC0u) == 0x80u;
    }

    [[nodiscard]] UBIN_FORCEINLINE const std::uint8_t* skip_ascii(const std::uint8_t* p, const std::uint8_t* e) noexcept {
        constexpr std::uint64_t kHighBits = 0x8080808080808080ull;

        while (e - p >= 8) {
            std::uint64_t w;
            std::memcpy(&w, p, 8);
            if (w & kHighBits)
                break;
            p += 8;
        }

        while (p < e && *p < 0x80u)
            ++p;

        return p;
    }

    // Rejects overlong forms, surrogates and code points above U+10FFFF.
    [[nodiscard]] inline bool validate_utf8(const std::uint8_t* p, const std::uint8_t* e) noexcept {
        while (p < e) {
            p = skip_ascii(p, e);

            if (p >= e)
                return true;

            const auto c = *p++;

            // 2-byte
            if ((c >> 5) == 0x6) {
                if (p >= e)
                    return false;

                const auto c1 = *p++;
                if (!is_cont(c1))
                    return false;

                if (((c & 0x1Fu) << 6 | (c1 & 0x3Fu)) < 0x80u)
                    return false;

                continue;
            }

            // 3-byte
            if ((c >> 4) == 0xE) {
                if (e - p < 2)
                    return false;

                const auto c1 = *p++;
                const auto c2 = *p++;

                if (!is_cont(c1) || !is_cont(c2))
                    return false;

                const std::uint32_t cp = (c & 0x0Fu) << 12 | (c1 & 0x3Fu) << 6 | (c2 & 0x3Fu);

                if (cp < 0x800u)
                    return false;

                if (cp >= 0xD800u && cp <= 0xDFFFu)
                    return false;

                continue;
            }

            // 4-byte
            if ((c >> 3) == 0x1E) {
                if (e - p < 3)
                    return false;

                const auto c1 = *p++;
                const auto c2 = *p++;
                const auto c3 = *p++;

                if (!is_cont(c1) || !is_cont(c2) || !is_cont(c3))
                    return false;

                const std::uint32_t cp = (c & 0x07u) << 18 | (c1 & 0x3Fu) << 12 | (c2 & 0x3Fu) << 6 | (c3 & 0x3Fu);

                if (cp < 0x10000u || cp > 0x10FFFFu)
                    return false;

                continue;
            }

            return false;
        }

        return true;
    }

    [[nodiscard]] UBIN_FORCEINLINE bool validate_utf8(const std::string_view s) noexcept {
        const auto* p = reinterpret_cast<const std::uint8_t*>(s.data());
        return validate_utf8(p, p + s.size());
    }

    // Number of bytes needed to hold v, at least one.
    [[nodiscard]] UBIN_FORCEINLINE constexpr std::uint8_t byte_width(const std::uint64_t v) noexcept {
        if (v == 0)
            return 1;
        return static_cast<std::uint8_t>((64 - std::countl_zero(v) + 7) / 8);
    }

    [[nodiscard]] UBIN_FORCEINLINE constexpr std::uint64_t zigzag_encode(const std::int64_t v) noexcept {
        return (static_cast<std::uint64_t>(v) << 1) ^ static_cast<std::uint64_t>(v >> 63);
    }

    [[nodiscard]] UBIN_FORCEINLINE constexpr std::int64_t zigzag_decode(const std::uint64_t v) noexcept {
        return static_cast<std::int64_t>((v >> 1) ^ (~(v & 1u) + 1u));
    }

    UBIN_FORCEINLINE void store_be(std::uint8_t* out, std::uint64_t v, const std::uint8_t width) noexcept {
        for (std::uint8_t i = width; i > 0; --i) {
            out[i - 1] = static_cast<std::uint8_t>(v & 0xFFu);
            v >>= 8;
        }
    }

    [[nodiscard]] UBIN_FORCEINLINE std::uint64_t load_be(const std::uint8_t* in, const std::uint8_t width) noexcept {
        std::uint64_t v = 0;
        for (std::uint8_t i = 0; i < width; ++i)
            v = (v << 8) | in[i];
        return v;
    }

    [[nodiscard]] UBIN_FORCEINLINE constexpr std::uint64_t mix64(std::uint64_t h) noexcept {
        h ^= h >> 33;
        h *= 0xFF51AFD7ED558CCDull;
        h ^= h >> 33;
        h *= 0xC4CEB9FE1A85EC53ull;
        h ^= h >> 33;
        return h;
    }

    [[nodiscard]] UBIN_FORCEINLINE constexpr std::uint64_t hash_combine(const std::uint64_t seed, const std::uint64_t v) noexcept {
        return mix64(seed ^ (v + 0x9E3779B97F4A7C15ull + (seed << 6) + (seed >> 2)));
    }

    [[nodiscard]] inline std::uint64_t hash_bytes(const void* data, std::size_t len) noexcept {
        const auto* p = static_cast<const std::uint8_t*>(data);
        std::uint64_t h = 0x9E3779B97F4A7C15ull ^ static_cast<std::uint64_t>(len);

        while (len >= 8) {
            std::uint64_t v;
            std::memcpy(&v, p, 8);
            h = hash_combine(h, v);
            p += 8;
            len -= 8;
        }

        std::uint64_t tail = 0;
        for (std::size_t i = 0; i < len; ++i)
            tail |= static_cast<std::uint64_t>(p[i]) << (i * 8);

        return hash_combine(h, tail);
    }

    [[nodiscard]] UBIN_FORCEINLINE constexpr std::uint32_t next_pow2(const std::uint32_t v) noexcept {
        if (v <= 1)
            return 1;
        if (v > (1u << 31))
            return 0;
        return 1u << (32u - std::countl_zero(v - 1u));
    }

} // namespace ubin::detail

namespace ubin {

    constexpr auto kDefaultBlockSize = 64ull * 1024ull;
    constexpr std::uint32_t kDefaultMaxDepth = 512;
    constexpr std::uint32_t kUnboundedDepth = std::numeric_limits<std::uint32_t>::max();

    template <uint64_t BlockSize = kDefaultBlockSize>
    struct NewAllocator {
        static constexpr auto kBlockSize = BlockSize;
        static constexpr bool kHeapBacked = true;

        void* allocate(std::size_t sz, std::size_t al) {
            if (al == 0 || !std::has_single_bit(al))
                return nullptr;

#if defined(_MSC_VER)
            return _aligned_malloc(sz, al);
#else
            void* p {};
            if (posix_memalign(&p, al, sz) != 0)
                return nullptr;
            return p;
#endif
        }

        // ReSharper disable once CppMemberFunctionMayBeStatic
        void deallocate(void* p, std::size_t, std::size_t) noexcept {
#if defined(_MSC_VER)
            _aligned_free(p);
#else
            std::free(p);
#endif
        }
    };

    // Bump allocator over an in-object buffer; never touches the heap.
    template <std::size_t N, uint64_t BlockSize = kDefaultBlockSize>
    struct StaticBufferAllocator {
        static constexpr auto kBlockSize = BlockSize;
        static constexpr auto kMaxSize = N;
        static constexpr bool kHeapBacked = false;

        alignas(std::max_align_t) std::byte buffer[N];
        std::size_t offset = 0;

        void* allocate(const std::size_t sz, const std::size_t al) {
            if (al == 0 || !std::has_single_bit(al))
                return nullptr;

            const auto base = reinterpret_cast<std::uintptr_t>(buffer);
            const auto mask = ~(static_cast<std::uintptr_t>(al) - 1u);
            const auto aligned_ptr = (base + offset + (static_cast<std::uintptr_t>(al) - 1u)) & mask;
            const auto aligned = aligned_ptr - base;

            if (aligned > kMaxSize || sz > kMaxSize - aligned)
                return nullptr;

            void* p = buffer + aligned;
            offset = aligned + sz;
            return p;
        }

        // ReSharper disable once CppMemberFunctionMayBeStatic
        void deallocate(void*, std::size_t, std::size_t) noexcept {
            // bump allocator: released by reset()
        }

        void reset() noexcept {
            offset = 0;
        }
    };

    // The caller's resource decides where memory comes from; typically a
    // stack buffer with std::pmr::null_memory_resource() upstream.
    template <uint64_t BlockSize = kDefaultBlockSize>
    struct PmrAllocator {
        static constexpr auto kBlockSize = BlockSize;
        static constexpr bool kHeapBacked = false;

        std::pmr::monotonic_buffer_resource* resource {};

        PmrAllocator() = default;

        explicit PmrAllocator(std::pmr::monotonic_buffer_resource* r): resource(r) { }

        [[nodiscard]] void* allocate(const std::size_t sz, const std::size_t al) const {
            if (!resource)
                return nullptr;
            try {
                return resource->allocate(sz, al);
            } catch (const std::bad_alloc&) {
                return nullptr;
            }
        }

        void deallocate(void* p, const std::size_t sz, const std::size_t al) const noexcept {
            if (resource)
                resource->deallocate(p, sz, al);
        }

        void reset() const noexcept {
            if (!resource)
                return;

            resource->release();
        }
    };

    template <class T>
    concept AllocatorLike = requires(T a, std::size_t sz, std::size_t align) {
        { T::kBlockSize } -> std::convertible_to<uint64_t>;
        { a.allocate(sz, align) } -> std::same_as<void*>;
        { a.deallocate(static_cast<void*>(nullptr), sz, align) } -> std::same_as<void>;
    };

    // Allocators that do not declare kHeapBacked are assumed to use the heap.
    template <class T>
    [[nodiscard]] constexpr bool is_heap_backed() noexcept {
        if constexpr (requires { T::kHeapBacked; })
            return T::kHeapBacked;
        else
            return true;
    }

    class Arena {
        struct Block {
            Block* next;
            std::size_t cap;
            std::size_t used;
        };

    public:
        template <AllocatorLike Alloc>
        explicit Arena(Alloc& alloc);

        ~Arena();

        Arena(const Arena&) = delete;
        Arena& operator=(const Arena&) = delete;

        Arena(Arena&& other) noexcept;
        Arena& operator=(Arena&& other) noexcept;

        void* alloc(std::size_t sz, std::size_t al = alignof(std::max_align_t));

        template <class T, class... Args>
        UBIN_FORCEINLINE T* make(Args&&... args) noexcept;

        template <class T>
        UBIN_FORCEINLINE T* make_array(std::size_t n);

        void reset();

        [[nodiscard]] bool heap_backed() const noexcept {
            return heap_backed_;
        }

    private:
        friend class ArenaHolder;

        static constexpr bool valid_align(const std::size_t a) noexcept {
            return a != 0 && std::has_single_bit(a);
        }

        // Follows an allocator that moved along with its owner.
        void rebind(const void* from, void* to) noexcept {
            if (allocator_ == from)
                allocator_ = to;
        }

        static char* payload(Block* b) noexcept;

        bool add_block(std::size_t min_payload);

        void* allocator_ {};
        void* (*alloc_fn_)(void*, std::size_t, std::size_t) {};
        void (*dealloc_fn_)(void*, void*, std::size_t, std::size_t) {};

        Block* head_ {};
        Block* cur_ {};
        std::size_t block_size_ {kDefaultBlockSize};
        std::size_t block_align_ {alignof(std::max_align_t)};
        bool heap_backed_ {true};
    };

    template <AllocatorLike Alloc>
    Arena::Arena(Alloc& alloc)
        : allocator_(&alloc), alloc_fn_([](void* self, std::size_t sz, std::size_t al) { return static_cast<Alloc*>(self)->allocate(sz, al); }),
          dealloc_fn_([](void* self, void* p, std::size_t sz, std::size_t al) { static_cast<Alloc*>(self)->deallocate(p, sz, al); }), block_size_(Alloc::kBlockSize),
          heap_backed_(is_heap_backed<Alloc>()) { }

    inline Arena::~Arena() {
        Block* b = head_;
        while (b) {
            Block* next = b->next;
            dealloc_fn_(allocator_, b, sizeof(Block) + b->cap, block_align_);
            b = next;
        }
    }

    inline Arena::Arena(Arena&& other) noexcept
        : allocator_(other.allocator_), alloc_fn_(other.alloc_fn_), dealloc_fn_(other.dealloc_fn_), head_(other.head_), cur_(other.cur_), block_size_(other.block_size_),
          block_align_(other.block_align_), heap_backed_(other.heap_backed_) {
        other.head_ = nullptr;
        other.cur_ = nullptr;
    }

    inline Arena& Arena::operator=(Arena&& other) noexcept {
        if (this != &other) {
            this->~Arena();
            allocator_ = other.allocator_;
            alloc_fn_ = other.alloc_fn_;
            dealloc_fn_ = other.dealloc_fn_;
            head_ = other.head_;
            cur_ = other.cur_;
            block_size_ = other.block_size_;
            block_align_ = other.block_align_;
            heap_backed_ = other.heap_backed_;
            other.head_ = nullptr;
            other.cur_ = nullptr;
        }
        return *this;
    }

    inline void* Arena::alloc(const std::size_t sz, const std::size_t al) {
        if (!valid_align(al))
            return nullptr;

        if (sz > std::numeric_limits<std::size_t>::max() - al - sizeof(Block))
            return nullptr;

        if (!cur_ && !add_block(sz + al))
            return nullptr;

        for (;;) {
            const auto base = reinterpret_cast<std::uintptr_t>(payload(cur_));

            const auto mask = ~(static_cast<std::uintptr_t>(al) - 1u);
            const std::uintptr_t aligned = (base + cur_->used + (static_cast<std::uintptr_t>(al) - 1u)) & mask;

            if (const std::size_t off = aligned - base; off + sz <= cur_->cap) {
                const auto ptr = std::bit_cast<void*>(aligned);
                cur_->used = off + sz;
                return ptr;
            }

            if (!add_block(sz + al))
                return nullptr;
        }
    }

    template <class T, class... Args>
    UBIN_FORCEINLINE T* Arena::make(Args&&... args) noexcept {
        void* mem = alloc(sizeof(T), alignof(T));
        if (!mem)
            return nullptr;

        T* ptr = static_cast<T*>(mem);

        static_assert(std::is_constructible_v<T, Args...>, "Type not constructible");
        return std::construct_at(ptr, std::forward<Args>(args)...);
    }

    template <class T>
    UBIN_FORCEINLINE T* Arena::make_array(const std::size_t n) {
        if (n > std::numeric_limits<std::size_t>::max() / sizeof(T))
            return nullptr;
        return static_cast<T*>(alloc(sizeof(T) * n, alignof(T))); // NOLINT(bugprone-sizeof-expression)
    }

    inline void Arena::reset() {
        Block* b = head_;
        while (b) {
            Block* next = b->next;
            dealloc_fn_(allocator_, b, sizeof(Block) + b->cap, block_align_);
            b = next;
        }
        head_ = nullptr;
        cur_ = nullptr;
    }

    inline char* Arena::payload(Block* b) noexcept {
        return reinterpret_cast<char*>(b + 1);
    }

    inline bool Arena::add_block(const std::size_t min_payload) {
        const std::size_t cap = std::max(block_size_, min_payload);
        const std::size_t total = sizeof(Block) + cap;

        block_align_ = std::max<std::size_t>(alignof(std::max_align_t), alignof(Block));
        void* mem = alloc_fn_(allocator_, total, block_align_);
        if (!mem)
            return false;

        auto* b = static_cast<Block*>(mem);
        b->next = nullptr;
        b->cap = cap;
        b->used = 0;

        if (!head_)
            head_ = b;
        else
            cur_->next = b;

        cur_ = b;
        return true;
    }

    class ArenaHolder {
    public:
        constexpr ArenaHolder() noexcept = default;

        explicit ArenaHolder(bool): own_alloc_ {NewAllocator {}}, own_arena_ {std::in_place, own_alloc_}, arena_ {&own_arena_.value()}, is_owner_ {true} { }

        template <AllocatorLike Allocator>
        explicit ArenaHolder(Allocator& alloc): own_arena_ {std::in_place, alloc}, arena_ {&own_arena_.value()}, is_owner_ {true} { }

        explicit ArenaHolder(Arena& arena) noexcept: arena_ {&arena} { }

        ~ArenaHolder() {
            reset();
        }

        ArenaHolder(const ArenaHolder&) = delete;
        ArenaHolder& operator=(const ArenaHolder&) = delete;

        ArenaHolder(ArenaHolder&& other) noexcept: own_alloc_(other.own_alloc_), own_arena_(std::move(other.own_arena_)), arena_(other.arena_), is_owner_(other.is_owner_) {
            if (is_owner_ && own_arena_.has_value()) {
                own_arena_->rebind(&other.own_alloc_, &own_alloc_);
                arena_ = &own_arena_.value();
            }

            other.arena_ = nullptr;
            other.is_owner_ = false;
            other.own_arena_.reset();
        }

        ArenaHolder& operator=(ArenaHolder&& other) noexcept {
            if (this == &other)
                return *this;
            reset();

            own_alloc_ = other.own_alloc_;
            own_arena_ = std::move(other.own_arena_);
            arena_ = other.arena_;
            is_owner_ = other.is_owner_;

            if (is_owner_ && own_arena_.has_value()) {
                own_arena_->rebind(&other.own_alloc_, &own_alloc_);
                arena_ = &own_arena_.value();
            }

            other.arena_ = nullptr;
            other.is_owner_ = false;
            other.own_arena_.reset();
            return *this;
        }

        [[nodiscard]] Arena& arena() const noexcept {
            assert(arena_);
            return *arena_;
        }

        [[nodiscard]] explicit operator bool() const noexcept {
            return arena_ != nullptr;
        }

        void reset() noexcept {
            if (is_owner_) {
                own_arena_.reset();
                is_owner_ = false;
            }
            arena_ = nullptr;
        }

    protected:
        [[no_unique_address]] NewAllocator<> own_alloc_ {};
        std::optional<Arena> own_arena_ {};
        Arena* arena_ = nullptr;
        bool is_owner_ = false;
    };

} // namespace ubin

namespace ubin {

    enum class ErrorCode : std::uint8_t {
        None,
        UnexpectedEof,
        UnknownTag,
        LengthOverflow,
        InvalidUtf8,
        DuplicateKeyPolicyViolation,
        DepthExceeded,
        BufferCapacityExceeded,
        AllocationDisallowed,
        TrailingBytes,
        LengthMismatch,
        ContainerUnderflow,
        TypeMismatch,
        NumberOutOfRange,
        HandlerRejected,
    };

    enum class ErrorFormat : std::uint8_t {
        Pretty,
        Compact
    };

    // Failure record shared by encoding and decoding. The first error set wins.
    struct Error {
        ErrorCode code {ErrorCode::None};
        std::size_t offset {};
        std::uint8_t byte {}; // offending tag byte, UnknownTag only

        UBIN_FORCEINLINE void set(const ErrorCode c, const std::size_t at, const std::uint8_t b = 0) noexcept {
            if (code == ErrorCode::None) {
                code = c;
                offset = at;
                byte = b;
            }
        }

        UBIN_FORCEINLINE void reset() noexcept {
            code = ErrorCode::None;
            offset = 0;
            byte = 0;
        }

        template <ErrorFormat Fmt>
        [[nodiscard]] std::string format(std::span<const std::uint8_t> input) const;

        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] UBIN_FORCEINLINE constexpr bool ok() const noexcept {
            return code == ErrorCode::None;
        }

        [[nodiscard]] UBIN_FORCEINLINE constexpr explicit operator bool() const noexcept {
            return ok();
        }
    };

    using DecodeError = Error;
    using EncodeError = Error;

    [[nodiscard]] constexpr const char* error_code_name(const ErrorCode c) noexcept {
        switch (c) {
        case ErrorCode::None:
            return "None";
        case ErrorCode::UnexpectedEof:
            return "UnexpectedEof";
        case ErrorCode::UnknownTag:
            return "UnknownTag";
        case ErrorCode::LengthOverflow:
            return "LengthOverflow";
        case ErrorCode::InvalidUtf8:
            return "InvalidUtf8";
        case ErrorCode::DuplicateKeyPolicyViolation:
            return "DuplicateKeyPolicyViolation";
        case ErrorCode::DepthExceeded:
            return "DepthExceeded";
        case ErrorCode::BufferCapacityExceeded:
            return "BufferCapacityExceeded";
        case ErrorCode::AllocationDisallowed:
            return "AllocationDisallowed";
        case ErrorCode::TrailingBytes:
            return "TrailingBytes";
        case ErrorCode::LengthMismatch:
            return "LengthMismatch";
        case ErrorCode::ContainerUnderflow:
            return "ContainerUnderflow";
        case ErrorCode::TypeMismatch:
            return "TypeMismatch";
        case ErrorCode::NumberOutOfRange:
            return "NumberOutOfRange";
        case ErrorCode::HandlerRejected:
            return "HandlerRejected";
        }
        return "Unknown";
    }

    namespace detail {
        inline constexpr char kHexDigits[] = "0123456789abcdef";

        inline void append_hex_byte(std::string& out, const std::uint8_t b) {
            out.push_back(kHexDigits[(b >> 4) & 0xF]);
            out.push_back(kHexDigits[b & 0xF]);
        }

        inline void append_hex_offset(std::string& out, const std::size_t v) {
            for (int shift = 28; shift >= 0; shift -= 4)
                out.push_back(kHexDigits[(v >> shift) & 0xF]);
        }
    } // namespace detail

    [[nodiscard]] inline std::string format_error_compact(const std::span<const std::uint8_t> input, const Error& e) {
        if (e.code == ErrorCode::None)
            return {};

        std::string out;
        out.reserve(96);

        out.append("ubin: ");
        out.append(error_code_name(e.code));
        out.append(" at offset ");
        out.append(std::to_string(e.offset));

        if (e.code == ErrorCode::UnknownTag) {
            out.append(" (tag 0x");
            detail::append_hex_byte(out, e.byte);
            out.push_back(')');
        } else if (e.offset < input.size()) {
            out.append(" byte 0x");
            detail::append_hex_byte(out, input[e.offset]);
        }

        return out;
    }

    // Renders a 16-byte hex row around the failing offset with a caret under it.
    [[nodiscard]] inline std::string format_error(const std::span<const std::uint8_t> input, const Error& e) {
        if (e.code == ErrorCode::None)
            return {};

        constexpr std::size_t kRow = 16;

        std::string out;
        out.reserve(192);

        out.append("ubin: ");
        out.append(error_code_name(e.code));
        if (e.code == ErrorCode::UnknownTag) {
            out.append(" (tag 0x");
            detail::append_hex_byte(out, e.byte);
            out.push_back(')');
        }
        out.push_back('\n');

        out.append(" --> offset ");
        out.append(std::to_string(e.offset));
        out.append(" of ");
        out.append(std::to_string(input.size()));
        out.append(" bytes\n");

        if (input.empty())
            return out;

        const std::size_t at = std::min(e.offset, input.size());
        const std::size_t start = (at == input.size() ? (at ? at - 1 : 0) : at) / kRow * kRow;
        const std::size_t end = std::min(start + kRow, input.size());

        std::string row = " ";
        detail::append_hex_offset(row, start);
        row.append(" | ");
        const std::size_t prefix = row.size();

        for (std::size_t i = start; i < end; ++i) {
            detail::append_hex_byte(row, input[i]);
            row.push_back(' ');
        }

        out.append(row);
        out.push_back('\n');

        std::string caret_line(prefix + (at - start) * 3 + 2, ' ');
        caret_line[prefix + (at - start) * 3] = '^';
        caret_line[prefix + (at - start) * 3 + 1] = '^';

        out.append(caret_line);
        if (at == input.size())
            out.append(" end of input");
        out.push_back('\n');

        return out;
    }

    template <ErrorFormat Fmt>
    std::string Error::format(const std::span<const std::uint8_t> input) const {
        if constexpr (Fmt == ErrorFormat::Compact)
            return format_error_compact(input, *this);
        else
            return format_error(input, *this);
    }

    inline std::string Error::to_string() const {
        return error_code_name(code);
    }

} // namespace ubin

namespace ubin {

    // ---- numeric ordering ----

    inline constexpr std::uint32_t kCanonicalNan32 = 0x7FC00000u;
    inline constexpr std::uint64_t kCanonicalNan64 = 0x7FF8000000000000ull;

    [[nodiscard]] UBIN_FORCEINLINE float canonicalize(const float v) noexcept {
        return std::isnan(v) ? std::bit_cast<float>(kCanonicalNan32) : v;
    }

    [[nodiscard]] UBIN_FORCEINLINE double canonicalize(const double v) noexcept {
        return std::isnan(v) ? std::bit_cast<double>(kCanonicalNan64) : v;
    }

    // Maps a double onto an unsigned key whose natural order is
    // -inf < negative < -0.0 < +0.0 < positive < +inf < NaN, all NaNs equal.
    [[nodiscard]] UBIN_FORCEINLINE std::uint64_t total_order_key(const double v) noexcept {
        const auto bits = std::bit_cast<std::uint64_t>(canonicalize(v));
        constexpr std::uint64_t kSign = 1ull << 63;
        return (bits & kSign) ? ~bits : bits | kSign;
    }

    [[nodiscard]] UBIN_FORCEINLINE int total_cmp(const double a, const double b) noexcept {
        const auto ka = total_order_key(a);
        const auto kb = total_order_key(b);
        return ka < kb ? -1 : (ka > kb ? 1 : 0);
    }

    [[nodiscard]] UBIN_FORCEINLINE int total_cmp(const float a, const float b) noexcept {
        return total_cmp(static_cast<double>(a), static_cast<double>(b));
    }

    struct Int {
        bool is_signed {};
        union {
            std::int64_t i;
            std::uint64_t u;
        };

        constexpr Int() noexcept: u(0) { }

        static constexpr Int from_i64(const std::int64_t v) noexcept {
            Int n;
            n.is_signed = true;
            n.i = v;
            return n;
        }

        static constexpr Int from_u64(const std::uint64_t v) noexcept {
            Int n;
            n.is_signed = false;
            n.u = v;
            return n;
        }

        [[nodiscard]] constexpr bool negative() const noexcept {
            return is_signed && i < 0;
        }

        [[nodiscard]] constexpr std::optional<std::int64_t> to_i64() const noexcept {
            if (is_signed)
                return i;
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                return std::nullopt;
            return static_cast<std::int64_t>(u);
        }

        [[nodiscard]] constexpr std::optional<std::uint64_t> to_u64() const noexcept {
            if (negative())
                return std::nullopt;
            return is_signed ? static_cast<std::uint64_t>(i) : u;
        }

        // The magnitude stored on the wire: zigzag for signed values.
        [[nodiscard]] constexpr std::uint64_t wire_bits() const noexcept {
            return is_signed ? detail::zigzag_encode(i) : u;
        }
    };

    // Compares by mathematical value; signedness is representation only.
    [[nodiscard]] constexpr int compare(const Int& a, const Int& b) noexcept {
        if (a.negative() != b.negative())
            return a.negative() ? -1 : 1;
        if (a.negative()) {
            return a.i < b.i ? -1 : (a.i > b.i ? 1 : 0);
        }
        const auto ua = *a.to_u64();
        const auto ub = *b.to_u64();
        return ua < ub ? -1 : (ua > ub ? 1 : 0);
    }

    [[nodiscard]] constexpr bool operator==(const Int& a, const Int& b) noexcept {
        return compare(a, b) == 0;
    }

    enum class FloatWidth : std::uint8_t {
        F32,
        F64
    };

    struct Float {
        FloatWidth width {FloatWidth::F64};
        union {
            float f;
            double d;
        };

        constexpr Float() noexcept: d(0.0) { }

        static constexpr Float from_f32(const float v) noexcept {
            Float n;
            n.width = FloatWidth::F32;
            n.f = v;
            return n;
        }

        static constexpr Float from_f64(const double v) noexcept {
            Float n;
            n.width = FloatWidth::F64;
            n.d = v;
            return n;
        }

        [[nodiscard]] constexpr double as_double() const noexcept {
            return width == FloatWidth::F32 ? static_cast<double>(f) : d;
        }
    };

    [[nodiscard]] UBIN_FORCEINLINE int compare(const Float& a, const Float& b) noexcept {
        return total_cmp(a.as_double(), b.as_double());
    }

    [[nodiscard]] UBIN_FORCEINLINE bool operator==(const Float& a, const Float& b) noexcept {
        return compare(a, b) == 0;
    }

    [[nodiscard]] UBIN_FORCEINLINE std::uint64_t hash_float(const Float& v) noexcept {
        return detail::mix64(total_order_key(v.as_double()));
    }

    [[nodiscard]] UBIN_FORCEINLINE std::uint64_t hash_int(const Int& v) noexcept {
        if (v.negative())
            return detail::mix64(static_cast<std::uint64_t>(v.i) ^ 0xA5A5A5A5A5A5A5A5ull);
        return detail::mix64(*v.to_u64());
    }

    // True when v survives a round trip through float bit-for-bit.
    [[nodiscard]] UBIN_FORCEINLINE bool fits_f32(const double v) noexcept {
        if (std::isnan(v))
            return true;
        if (std::isinf(v))
            return true;
        if (std::abs(v) > static_cast<double>(std::numeric_limits<float>::max()))
            return false;
        const auto narrowed = static_cast<float>(v);
        return std::bit_cast<std::uint64_t>(static_cast<double>(narrowed)) == std::bit_cast<std::uint64_t>(v);
    }

} // namespace ubin

namespace ubin {

    // ---- header codec ----
    //
    // The position of the highest set bit in the first byte selects the kind:
    //
    //   1 C S xxxxx   Int     C: compact value in xxxxx, else width-1 in bits 0-2
    //   0 1 C xxxxx   String  C: compact length in xxxxx, else width-1 in bits 0-2
    //   0 0 1 C xxxx  Seq     C: compact count in xxxx, else width-1 in bits 0-2
    //   0 0 0 1 C xxx Map     C: compact count in xxx, else width-1 in bits 0-2
    //   0 0 0 0 1 www Float   payload width-1 (4 or 8 bytes)
    //   0 0 0 0 0 1 ee Bytes  length width 1 << ee
    //   0 0 0 0 0 0 1 v Bool
    //   0 0 0 0 0 0 0 1 Unit
    //   0 0 0 0 0 0 0 0 Null
    //
    // Extended lengths, integer magnitudes and float bits are big-endian.

    enum class Marker : std::uint8_t {
        Null,
        Unit,
        Bool,
        Bytes,
        Float,
        Map,
        Seq,
        String,
        Int
    };

    [[nodiscard]] constexpr const char* marker_name(const Marker m) noexcept {
        switch (m) {
        case Marker::Null:
            return "null";
        case Marker::Unit:
            return "unit";
        case Marker::Bool:
            return "bool";
        case Marker::Bytes:
            return "bytes";
        case Marker::Float:
            return "float";
        case Marker::Map:
            return "map";
        case Marker::Seq:
            return "seq";
        case Marker::String:
            return "string";
        case Marker::Int:
            return "int";
        }
        return "unknown";
    }

    // Every byte classifies; reserved bit patterns are rejected later.
    [[nodiscard]] UBIN_FORCEINLINE constexpr Marker detect_marker(const std::uint8_t byte) noexcept {
        if (byte == 0)
            return Marker::Null;
        return static_cast<Marker>(std::bit_width(byte));
    }

    namespace bits {
        inline constexpr std::uint8_t kIntType = 0b1000'0000;
        inline constexpr std::uint8_t kIntCompact = 0b0100'0000;
        inline constexpr std::uint8_t kIntSigned = 0b0010'0000;
        inline constexpr std::uint8_t kIntCompactValue = 0b0001'1111;
        inline constexpr std::uint8_t kIntReserved = 0b0001'1000;

        inline constexpr std::uint8_t kStringType = 0b0100'0000;
        inline constexpr std::uint8_t kStringCompact = 0b0010'0000;
        inline constexpr std::uint8_t kStringCompactLen = 0b0001'1111;
        inline constexpr std::uint8_t kStringReserved = 0b0001'1000;

        inline constexpr std::uint8_t kSeqType = 0b0010'0000;
        inline constexpr std::uint8_t kSeqCompact = 0b0001'0000;
        inline constexpr std::uint8_t kSeqCompactLen = 0b0000'1111;
        inline constexpr std::uint8_t kSeqReserved = 0b0000'1000;

        inline constexpr std::uint8_t kMapType = 0b0001'0000;
        inline constexpr std::uint8_t kMapCompact = 0b0000'1000;
        inline constexpr std::uint8_t kMapCompactLen = 0b0000'0111;

        inline constexpr std::uint8_t kFloatType = 0b0000'1000;
        inline constexpr std::uint8_t kBytesType = 0b0000'0100;
        inline constexpr std::uint8_t kBoolType = 0b0000'0010;
        inline constexpr std::uint8_t kUnitType = 0b0000'0001;

        inline constexpr std::uint8_t kWidthBits = 0b0000'0111;
        inline constexpr std::uint8_t kBytesWidthExp = 0b0000'0011;
    } // namespace bits

    // Largest String/Bytes payload and Seq/Map count a header may declare.
    inline constexpr std::uint64_t kMaxPayloadLength = static_cast<std::uint64_t>(std::numeric_limits<std::ptrdiff_t>::max());
    inline constexpr std::uint64_t kMaxContainerCount = std::numeric_limits<std::uint32_t>::max();

    struct Header {
        Marker marker {Marker::Null};
        bool compact {true};
        bool flag {};        // Int: signed. Bool: value
        std::uint8_t width {}; // bytes following the tag byte before the payload; Float: payload width
        std::uint64_t value {}; // Int: wire magnitude. String/Bytes: length. Seq/Map: count

        static constexpr Header null() noexcept {
            return {};
        }

        static constexpr Header unit() noexcept {
            return {.marker = Marker::Unit};
        }

        static constexpr Header boolean(const bool v) noexcept {
            return {.marker = Marker::Bool, .flag = v};
        }

        static constexpr Header integer(const Int& v) noexcept {
            const auto w = v.wire_bits();
            if (w <= bits::kIntCompactValue)
                return {.marker = Marker::Int, .compact = true, .flag = v.is_signed, .width = 0, .value = w};
            return {.marker = Marker::Int, .compact = false, .flag = v.is_signed, .width = detail::byte_width(w), .value = w};
        }

        static constexpr Header f32() noexcept {
            return {.marker = Marker::Float, .compact = false, .width = 4};
        }

        static constexpr Header f64() noexcept {
            return {.marker = Marker::Float, .compact = false, .width = 8};
        }

        static constexpr Header string(const std::uint64_t len) noexcept {
            return with_length(Marker::String, len, bits::kStringCompactLen);
        }

        static constexpr Header seq(const std::uint64_t count) noexcept {
            return with_length(Marker::Seq, count, bits::kSeqCompactLen);
        }

        static constexpr Header map(const std::uint64_t count) noexcept {
            return with_length(Marker::Map, count, bits::kMapCompactLen);
        }

        static constexpr Header bytes(const std::uint64_t len) noexcept {
            const auto w = detail::byte_width(len);
            const std::uint8_t pow2 = w <= 1 ? 1 : (w <= 2 ? 2 : (w <= 4 ? 4 : 8));
            return {.marker = Marker::Bytes, .compact = false, .width = pow2, .value = len};
        }

        [[nodiscard]] constexpr bool is_container() const noexcept {
            return marker == Marker::Seq || marker == Marker::Map;
        }

        // Seq/Map element count, String/Bytes length.
        [[nodiscard]] constexpr std::uint64_t length() const noexcept {
            return value;
        }

        // Number of header bytes on the wire, tag byte included.
        [[nodiscard]] constexpr std::size_t encoded_size() const noexcept {
            if (marker == Marker::Float)
                return 1;
            return 1u + (compact ? 0u : width);
        }

    private:
        static constexpr Header with_length(const Marker m, const std::uint64_t len, const std::uint8_t compact_max) noexcept {
            if (len <= compact_max)
                return {.marker = m, .compact = true, .width = 0, .value = len};
            return {.marker = m, .compact = false, .width = detail::byte_width(len), .value = len};
        }
    };

    [[nodiscard]] constexpr bool operator==(const Header& a, const Header& b) noexcept {
        return a.marker == b.marker && a.compact == b.compact && a.flag == b.flag && a.width == b.width && a.value == b.value;
    }

    // Tag byte for h; the extended length/magnitude bytes follow it.
    [[nodiscard]] constexpr std::uint8_t header_tag(const Header& h) noexcept {
        const auto w = static_cast<std::uint8_t>(h.width ? h.width - 1u : 0u);
        switch (h.marker) {
        case Marker::Int: {
            std::uint8_t b = bits::kIntType;
            if (h.flag)
                b |= bits::kIntSigned;
            if (h.compact)
                return static_cast<std::uint8_t>(b | bits::kIntCompact | (h.value & bits::kIntCompactValue));
            return static_cast<std::uint8_t>(b | w);
        }
        case Marker::String:
            if (h.compact)
                return static_cast<std::uint8_t>(bits::kStringType | bits::kStringCompact | (h.value & bits::kStringCompactLen));
            return static_cast<std::uint8_t>(bits::kStringType | w);
        case Marker::Seq:
            if (h.compact)
                return static_cast<std::uint8_t>(bits::kSeqType | bits::kSeqCompact | (h.value & bits::kSeqCompactLen));
            return static_cast<std::uint8_t>(bits::kSeqType | w);
        case Marker::Map:
            if (h.compact)
                return static_cast<std::uint8_t>(bits::kMapType | bits::kMapCompact | (h.value & bits::kMapCompactLen));
            return static_cast<std::uint8_t>(bits::kMapType | w);
        case Marker::Float:
            return static_cast<std::uint8_t>(bits::kFloatType | w);
        case Marker::Bytes:
            return static_cast<std::uint8_t>(bits::kBytesType | std::countr_zero(static_cast<unsigned>(h.width ? h.width : 1)));
        case Marker::Bool:
            return static_cast<std::uint8_t>(bits::kBoolType | (h.flag ? 1u : 0u));
        case Marker::Unit:
            return bits::kUnitType;
        case Marker::Null:
            return 0;
        }
        return 0;
    }

    // Writes h into out (at least 9 bytes). Returns the number of bytes written.
    UBIN_FORCEINLINE std::size_t write_header(std::uint8_t* out, const Header& h) noexcept {
        out[0] = header_tag(h);
        if (h.compact || h.marker == Marker::Float)
            return 1;
        detail::store_be(out + 1, h.value, h.width);
        return 1u + h.width;
    }

    // Decodes the header at in[pos]; on success advances pos past the header.
    // Does not check that the declared payload is present.
    [[nodiscard]] inline bool read_header(const std::span<const std::uint8_t> in, std::size_t& pos, Header& h, Error& err) noexcept {
        const std::size_t at = pos;
        if (at >= in.size()) {
            err.set(ErrorCode::UnexpectedEof, in.size());
            return false;
        }

        const std::uint8_t byte = in[at];
        h = Header {};
        h.marker = detect_marker(byte);

        auto extended = [&](const std::uint8_t width) -> bool {
            if (in.size() - at - 1 < width) {
                err.set(ErrorCode::UnexpectedEof, in.size());
                return false;
            }
            h.compact = false;
            h.width = width;
            h.value = detail::load_be(in.data() + at + 1, width);
            pos = at + 1 + width;
            return true;
        };

        auto unknown = [&]() -> bool {
            err.set(ErrorCode::UnknownTag, at, byte);
            return false;
        };

        auto compact = [&](const std::uint64_t v) -> bool {
            h.compact = true;
            h.value = v;
            pos = at + 1;
            return true;
        };

        switch (h.marker) {
        case Marker::Int:
            h.flag = (byte & bits::kIntSigned) != 0;
            if (byte & bits::kIntCompact)
                return compact(byte & bits::kIntCompactValue);
            if (byte & bits::kIntReserved)
                return unknown();
            return extended(static_cast<std::uint8_t>((byte & bits::kWidthBits) + 1u));

        case Marker::String:
            if (byte & bits::kStringCompact)
                return compact(byte & bits::kStringCompactLen);
            if (byte & bits::kStringReserved)
                return unknown();
            if (!extended(static_cast<std::uint8_t>((byte & bits::kWidthBits) + 1u)))
                return false;
            break;

        case Marker::Seq:
            if (byte & bits::kSeqCompact)
                return compact(byte & bits::kSeqCompactLen);
            if (byte & bits::kSeqReserved)
                return unknown();
            if (!extended(static_cast<std::uint8_t>((byte & bits::kWidthBits) + 1u)))
                return false;
            break;

        case Marker::Map:
            if (byte & bits::kMapCompact)
                return compact(byte & bits::kMapCompactLen);
            if (!extended(static_cast<std::uint8_t>((byte & bits::kWidthBits) + 1u)))
                return false;
            break;

        case Marker::Float: {
            const auto width = static_cast<std::uint8_t>((byte & bits::kWidthBits) + 1u);
            if (width != 4 && width != 8)
                return unknown();
            h.compact = false;
            h.width = width;
            pos = at + 1;
            return true;
        }

        case Marker::Bytes:
            if (!extended(static_cast<std::uint8_t>(1u << (byte & bits::kBytesWidthExp))))
                return false;
            break;

        case Marker::Bool:
            h.flag = (byte & 1u) != 0;
            pos = at + 1;
            return true;

        case Marker::Unit:
        case Marker::Null:
            pos = at + 1;
            return true;
        }

        const bool counted = h.marker == Marker::Seq || h.marker == Marker::Map;
        if (h.value > (counted ? kMaxContainerCount : kMaxPayloadLength)) {
            pos = at;
            err.set(ErrorCode::LengthOverflow, at);
            return false;
        }
        return true;
    }

} // namespace ubin

namespace ubin {

    // ---- value model ----

    enum class Type : std::uint8_t {
        Null,
        Unit,
        Bool,
        Int,
        Float,
        Bytes,
        String,
        Seq,
        Map
    };

    [[nodiscard]] constexpr const char* type_name(const Type t) noexcept {
        switch (t) {
        case Type::Null:
            return "null";
        case Type::Unit:
            return "unit";
        case Type::Bool:
            return "bool";
        case Type::Int:
            return "int";
        case Type::Float:
            return "float";
        case Type::Bytes:
            return "bytes";
        case Type::String:
            return "string";
        case Type::Seq:
            return "seq";
        case Type::Map:
            return "map";
        }
        return "unknown";
    }

    enum class MapOrder : std::uint8_t {
        Insertion,
        Hashed
    };

    enum class StringPolicy : std::uint8_t {
        View,
        Copy
    };

    enum class DuplicateKeys : std::uint8_t {
        Overwrite,
        Reject
    };

    struct Node;

    struct MapEntry {
        Node* key;
        Node* value;
        std::uint64_t hash;
    };

    struct Node {
        Type type {Type::Null};
        MapOrder order {MapOrder::Insertion};
        // Set once the node is part of a map key; its hash is stored in the entry.
        bool frozen {};

        union Data {
            bool b;
            Int i;
            Float f;
            std::span<const std::uint8_t> bytes;
            std::string_view str;

            struct {
                std::uint32_t count;
                std::uint32_t capacity;
                Node** items;
            } seq;

            // Insertion order: entries[0, count) dense, index holds entry position + 1.
            // Hashed: entries is the open-addressed table itself, empty slots have no key.
            struct {
                std::uint32_t count;
                std::uint32_t capacity;
                MapEntry* entries;
                std::uint32_t* index;
                std::uint32_t index_cap;
            } map;

            Data() { }

        } data;

        [[nodiscard]] constexpr bool is_container() const noexcept {
            return type == Type::Seq || type == Type::Map;
        }
    };

    static_assert(std::is_trivially_copyable_v<Node>);

    [[nodiscard]] inline std::uint64_t hash_node(const Node& n) noexcept;
    [[nodiscard]] inline bool equal_nodes(const Node& a, const Node& b) noexcept;
    [[nodiscard]] inline int compare_nodes(const Node& a, const Node& b) noexcept;

    enum class InsertResult : std::uint8_t {
        Inserted,
        Replaced,
        Duplicate,
        OutOfMemory
    };

    namespace detail {
        inline constexpr std::uint32_t kMinTable = 8;

        // Table size keeping the load factor under 0.7 for n entries.
        [[nodiscard]] UBIN_FORCEINLINE constexpr std::uint32_t table_size_for(const std::uint32_t n) noexcept {
            const std::uint64_t want = static_cast<std::uint64_t>(n) * 10u / 7u + 1u;
            if (want > (1ull << 31))
                return 0;
            return std::max(kMinTable, next_pow2(static_cast<std::uint32_t>(want)));
        }

        [[nodiscard]] UBIN_FORCEINLINE constexpr bool over_load(const std::uint32_t n, const std::uint32_t cap) noexcept {
            return static_cast<std::uint64_t>(n) * 10u > static_cast<std::uint64_t>(cap) * 7u;
        }
    } // namespace detail

    // Insertion-ordered map: dense entry array plus an open-addressed index.
    struct OrderedMap {
        static constexpr MapOrder kOrder = MapOrder::Insertion;

        [[nodiscard]] static bool init(Arena& a, Node& map, const std::uint32_t cap) {
            map.type = Type::Map;
            map.order = kOrder;
            auto& m = map.data.map;
            m.count = 0;
            m.capacity = std::max(1u, cap);
            m.entries = a.make_array<MapEntry>(m.capacity);
            m.index_cap = detail::table_size_for(m.capacity);
            m.index = m.index_cap ? a.make_array<std::uint32_t>(m.index_cap) : nullptr;
            if (!m.entries || !m.index)
                return false;
            std::memset(m.index, 0, sizeof(std::uint32_t) * m.index_cap);
            return true;
        }

        [[nodiscard]] static MapEntry* find(const Node& map, const Node& key, const std::uint64_t h) noexcept {
            const auto& m = map.data.map;
            if (!m.index_cap)
                return nullptr;

            const std::uint32_t mask = m.index_cap - 1u;
            auto pos = static_cast<std::uint32_t>(h) & mask;

            for (std::uint32_t step = 0; step < m.index_cap; ++step) {
                const std::uint32_t slot = m.index[pos];
                if (slot == 0)
                    return nullptr;

                MapEntry* e = m.entries + (slot - 1u);
                if (e->hash == h && equal_nodes(*e->key, key))
                    return e;

                pos = (pos + 1u) & mask;
            }
            return nullptr;
        }

        [[nodiscard]] static InsertResult insert(Arena& a, Node& map, Node* key, Node* value, const DuplicateKeys policy) {
            const auto h = hash_node(*key);
            if (MapEntry* e = find(map, *key, h)) {
                if (policy == DuplicateKeys::Reject)
                    return InsertResult::Duplicate;
                e->value = value;
                return InsertResult::Replaced;
            }

            auto& m = map.data.map;
            if (m.count == std::numeric_limits<std::uint32_t>::max())
                return InsertResult::OutOfMemory;

            if (m.count == m.capacity) {
                const std::uint32_t new_cap = m.capacity > std::numeric_limits<std::uint32_t>::max() / 2u ? std::numeric_limits<std::uint32_t>::max() : m.capacity * 2u;
                auto* bigger = a.make_array<MapEntry>(new_cap);
                if (!bigger)
                    return InsertResult::OutOfMemory;
                std::memcpy(bigger, m.entries, sizeof(MapEntry) * m.count);
                m.entries = bigger;
                m.capacity = new_cap;
            }

            if (detail::over_load(m.count + 1u, m.index_cap) && !rebuild_index(a, map, m.index_cap * 2u))
                return InsertResult::OutOfMemory;

            m.entries[m.count] = MapEntry {key, value, h};
            place(m.index, m.index_cap, h, m.count + 1u);
            ++m.count;
            return InsertResult::Inserted;
        }

    private:
        static void place(std::uint32_t* index, const std::uint32_t cap, const std::uint64_t h, const std::uint32_t slot) noexcept {
            const std::uint32_t mask = cap - 1u;
            auto pos = static_cast<std::uint32_t>(h) & mask;
            while (index[pos] != 0)
                pos = (pos + 1u) & mask;
            index[pos] = slot;
        }

        [[nodiscard]] static bool rebuild_index(Arena& a, Node& map, const std::uint32_t new_cap) {
            auto& m = map.data.map;
            if (new_cap == 0 || !std::has_single_bit(new_cap))
                return false;

            auto* index = a.make_array<std::uint32_t>(new_cap);
            if (!index)
                return false;
            std::memset(index, 0, sizeof(std::uint32_t) * new_cap);

            for (std::uint32_t i = 0; i < m.count; ++i)
                place(index, new_cap, m.entries[i].hash, i + 1u);

            m.index = index;
            m.index_cap = new_cap;
            return true;
        }
    };

    // Unordered map: entries live directly in an open-addressed table.
    struct HashedMap {
        static constexpr MapOrder kOrder = MapOrder::Hashed;

        [[nodiscard]] static bool init(Arena& a, Node& map, const std::uint32_t cap) {
            map.type = Type::Map;
            map.order = kOrder;
            auto& m = map.data.map;
            m.count = 0;
            m.index = nullptr;
            m.index_cap = 0;
            m.capacity = detail::table_size_for(cap);
            m.entries = m.capacity ? a.make_array<MapEntry>(m.capacity) : nullptr;
            if (!m.entries)
                return false;
            std::memset(m.entries, 0, sizeof(MapEntry) * m.capacity);
            return true;
        }

        [[nodiscard]] static MapEntry* find(const Node& map, const Node& key, const std::uint64_t h) noexcept {
            const auto& m = map.data.map;
            if (!m.capacity)
                return nullptr;

            const std::uint32_t mask = m.capacity - 1u;
            auto pos = static_cast<std::uint32_t>(h) & mask;

            for (std::uint32_t step = 0; step < m.capacity; ++step) {
                MapEntry* e = m.entries + pos;
                if (!e->key)
                    return nullptr;
                if (e->hash == h && equal_nodes(*e->key, key))
                    return e;
                pos = (pos + 1u) & mask;
            }
            return nullptr;
        }

        [[nodiscard]] static InsertResult insert(Arena& a, Node& map, Node* key, Node* value, const DuplicateKeys policy) {
            const auto h = hash_node(*key);
            if (MapEntry* e = find(map, *key, h)) {
                if (policy == DuplicateKeys::Reject)
                    return InsertResult::Duplicate;
                e->value = value;
                return InsertResult::Replaced;
            }

            auto& m = map.data.map;
            if (detail::over_load(m.count + 1u, m.capacity) && !rehash(a, map, m.capacity * 2u))
                return InsertResult::OutOfMemory;

            place(m.entries, m.capacity, MapEntry {key, value, h});
            ++m.count;
            return InsertResult::Inserted;
        }

    private:
        static void place(MapEntry* table, const std::uint32_t cap, const MapEntry& e) noexcept {
            const std::uint32_t mask = cap - 1u;
            auto pos = static_cast<std::uint32_t>(e.hash) & mask;
            while (table[pos].key)
                pos = (pos + 1u) & mask;
            table[pos] = e;
        }

        [[nodiscard]] static bool rehash(Arena& a, Node& map, const std::uint32_t new_cap) {
            auto& m = map.data.map;
            if (new_cap == 0 || !std::has_single_bit(new_cap))
                return false;

            auto* table = a.make_array<MapEntry>(new_cap);
            if (!table)
                return false;
            std::memset(table, 0, sizeof(MapEntry) * new_cap);

            for (std::uint32_t i = 0; i < m.capacity; ++i) {
                if (m.entries[i].key)
                    place(table, new_cap, m.entries[i]);
            }

            m.entries = table;
            m.capacity = new_cap;
            return true;
        }
    };

    template <class T>
    concept MapStrategy = requires(Arena& a, Node& n, const Node& cn, Node* p, std::uint32_t cap, std::uint64_t h, DuplicateKeys d) {
        { T::kOrder } -> std::convertible_to<MapOrder>;
        { T::init(a, n, cap) } -> std::same_as<bool>;
        { T::find(cn, cn, h) } -> std::same_as<MapEntry*>;
        { T::insert(a, n, p, p, d) } -> std::same_as<InsertResult>;
    };

    static_assert(MapStrategy<OrderedMap>);
    static_assert(MapStrategy<HashedMap>);

    [[nodiscard]] UBIN_FORCEINLINE MapEntry* find_entry(const Node& map, const Node& key) noexcept {
        if (map.type != Type::Map)
            return nullptr;
        const auto h = hash_node(key);
        return map.order == MapOrder::Insertion ? OrderedMap::find(map, key, h) : HashedMap::find(map, key, h);
    }

    // Iterates live entries of either map layout.
    class MapIter {
    public:
        MapIter() = default;
        MapIter(const MapEntry* p, const MapEntry* e) noexcept: p_(p), e_(e) {
            skip();
        }

        [[nodiscard]] const MapEntry& operator*() const noexcept {
            return *p_;
        }

        [[nodiscard]] const MapEntry* operator->() const noexcept {
            return p_;
        }

        MapIter& operator++() noexcept {
            ++p_;
            skip();
            return *this;
        }

        [[nodiscard]] bool operator==(const MapIter& o) const noexcept {
            return p_ == o.p_;
        }

    private:
        void skip() noexcept {
            while (p_ != e_ && !p_->key)
                ++p_;
        }

        const MapEntry* p_ {};
        const MapEntry* e_ {};
    };

    struct MapEntries {
        const MapEntry* first {};
        const MapEntry* last {};

        [[nodiscard]] MapIter begin() const noexcept {
            return {first, last};
        }

        [[nodiscard]] MapIter end() const noexcept {
            return {last, last};
        }
    };

    [[nodiscard]] UBIN_FORCEINLINE MapEntries map_entries(const Node& map) noexcept {
        if (map.type != Type::Map || !map.data.map.entries)
            return {};
        const auto& m = map.data.map;
        const std::uint32_t span = map.order == MapOrder::Insertion ? m.count : m.capacity;
        return {m.entries, m.entries + span};
    }

    namespace detail {
        // Smallest key strictly greater than prev (or the smallest key when prev
        // is null). Quadratic when used to walk a whole map, but needs no memory.
        [[nodiscard]] inline const MapEntry* next_entry_after(const Node& map, const Node* prev) noexcept {
            const MapEntry* best = nullptr;
            for (const auto& e : map_entries(map)) {
                if (prev && compare_nodes(*e.key, *prev) <= 0)
                    continue;
                if (!best || compare_nodes(*e.key, *best->key) < 0)
                    best = &e;
            }
            return best;
        }

        [[nodiscard]] UBIN_FORCEINLINE constexpr int cmp3(const std::size_t a, const std::size_t b) noexcept {
            return a < b ? -1 : (a > b ? 1 : 0);
        }

        [[nodiscard]] inline int compare_raw(const void* a, const std::size_t na, const void* b, const std::size_t nb) noexcept {
            const std::size_t n = std::min(na, nb);
            if (n) {
                if (const int c = std::memcmp(a, b, n); c != 0)
                    return c < 0 ? -1 : 1;
            }
            return cmp3(na, nb);
        }
    } // namespace detail

    inline std::uint64_t hash_node(const Node& n) noexcept {
        const auto tag = static_cast<std::uint64_t>(n.type);
        switch (n.type) {
        case Type::Null:
        case Type::Unit:
            return detail::mix64(tag + 1u);
        case Type::Bool:
            return detail::hash_combine(tag, n.data.b ? 1u : 0u);
        case Type::Int:
            return detail::hash_combine(tag, hash_int(n.data.i));
        case Type::Float:
            return detail::hash_combine(tag, hash_float(n.data.f));
        case Type::Bytes:
            return detail::hash_combine(tag, detail::hash_bytes(n.data.bytes.data(), n.data.bytes.size()));
        case Type::String:
            return detail::hash_combine(tag, detail::hash_bytes(n.data.str.data(), n.data.str.size()));
        case Type::Seq: {
            std::uint64_t h = detail::hash_combine(tag, n.data.seq.count);
            for (std::uint32_t i = 0; i < n.data.seq.count; ++i)
                h = detail::hash_combine(h, hash_node(*n.data.seq.items[i]));
            return h;
        }
        case Type::Map: {
            // order-independent: maps with the same entries hash alike
            std::uint64_t sum = 0;
            for (const auto& e : map_entries(n))
                sum += detail::hash_combine(e.hash, hash_node(*e.value));
            return detail::hash_combine(detail::hash_combine(tag, n.data.map.count), sum);
        }
        }
        return 0;
    }

    inline bool equal_nodes(const Node& a, const Node& b) noexcept {
        if (&a == &b)
            return true;
        if (a.type != b.type)
            return false;

        switch (a.type) {
        case Type::Null:
        case Type::Unit:
            return true;
        case Type::Bool:
            return a.data.b == b.data.b;
        case Type::Int:
            return a.data.i == b.data.i;
        case Type::Float:
            return a.data.f == b.data.f;
        case Type::Bytes:
            return detail::compare_raw(a.data.bytes.data(), a.data.bytes.size(), b.data.bytes.data(), b.data.bytes.size()) == 0;
        case Type::String:
            return a.data.str == b.data.str;
        case Type::Seq: {
            if (a.data.seq.count != b.data.seq.count)
                return false;
            for (std::uint32_t i = 0; i < a.data.seq.count; ++i) {
                if (!equal_nodes(*a.data.seq.items[i], *b.data.seq.items[i]))
                    return false;
            }
            return true;
        }
        case Type::Map: {
            if (a.data.map.count != b.data.map.count)
                return false;
            for (const auto& e : map_entries(a)) {
                const MapEntry* other = find_entry(b, *e.key);
                if (!other || !equal_nodes(*e.value, *other->value))
                    return false;
            }
            return true;
        }
        }
        return false;
    }

    inline int compare_nodes(const Node& a, const Node& b) noexcept {
        if (&a == &b)
            return 0;
        if (a.type != b.type)
            return a.type < b.type ? -1 : 1;

        switch (a.type) {
        case Type::Null:
        case Type::Unit:
            return 0;
        case Type::Bool:
            return a.data.b == b.data.b ? 0 : (a.data.b ? 1 : -1);
        case Type::Int:
            return compare(a.data.i, b.data.i);
        case Type::Float:
            return compare(a.data.f, b.data.f);
        case Type::Bytes:
            return detail::compare_raw(a.data.bytes.data(), a.data.bytes.size(), b.data.bytes.data(), b.data.bytes.size());
        case Type::String:
            return detail::compare_raw(a.data.str.data(), a.data.str.size(), b.data.str.data(), b.data.str.size());
        case Type::Seq: {
            const auto n = std::min(a.data.seq.count, b.data.seq.count);
            for (std::uint32_t i = 0; i < n; ++i) {
                if (const int c = compare_nodes(*a.data.seq.items[i], *b.data.seq.items[i]); c != 0)
                    return c;
            }
            return detail::cmp3(a.data.seq.count, b.data.seq.count);
        }
        case Type::Map: {
            if (a.data.map.count != b.data.map.count)
                return detail::cmp3(a.data.map.count, b.data.map.count);

            const MapEntry* ea = detail::next_entry_after(a, nullptr);
            const MapEntry* eb = detail::next_entry_after(b, nullptr);
            while (ea && eb) {
                if (const int c = compare_nodes(*ea->key, *eb->key); c != 0)
                    return c;
                if (const int c = compare_nodes(*ea->value, *eb->value); c != 0)
                    return c;
                ea = detail::next_entry_after(a, ea->key);
                eb = detail::next_entry_after(b, eb->key);
            }
            return 0;
        }
        }
        return 0;
    }

} // namespace ubin

namespace ubin {

    class ValueRef {
    public:
        ValueRef() = default;
        ValueRef(const Node* n, Arena* a): n_(n), arena_(a) { }

        [[nodiscard]] UBIN_FORCEINLINE Type type() const noexcept {
            return n_ ? n_->type : Type::Null;
        }
        [[nodiscard]] UBIN_FORCEINLINE const Node* raw() const noexcept {
            return n_;
        }
        [[nodiscard]] UBIN_FORCEINLINE Arena* arena() const noexcept {
            return arena_;
        }
        [[nodiscard]] UBIN_FORCEINLINE bool valid() const noexcept {
            return n_ != nullptr;
        }

        [[nodiscard]] UBIN_FORCEINLINE bool is_null() const noexcept {
            return !n_ || n_->type == Type::Null;
        }
        [[nodiscard]] UBIN_FORCEINLINE bool is_unit() const noexcept {
            return n_ && n_->type == Type::Unit;
        }
        [[nodiscard]] UBIN_FORCEINLINE bool is_bool() const noexcept {
            return n_ && n_->type == Type::Bool;
        }
        [[nodiscard]] UBIN_FORCEINLINE bool is_int() const noexcept {
            return n_ && n_->type == Type::Int;
        }
        [[nodiscard]] UBIN_FORCEINLINE bool is_float() const noexcept {
            return n_ && n_->type == Type::Float;
        }
        [[nodiscard]] UBIN_FORCEINLINE bool is_bytes() const noexcept {
            return n_ && n_->type == Type::Bytes;
        }
        [[nodiscard]] UBIN_FORCEINLINE bool is_string() const noexcept {
            return n_ && n_->type == Type::String;
        }
        [[nodiscard]] UBIN_FORCEINLINE bool is_seq() const noexcept {
            return n_ && n_->type == Type::Seq;
        }
        [[nodiscard]] UBIN_FORCEINLINE bool is_map() const noexcept {
            return n_ && n_->type == Type::Map;
        }

        [[nodiscard]] UBIN_FORCEINLINE std::optional<bool> try_bool() const noexcept {
            if (is_bool())
                return n_->data.b;
            return std::nullopt;
        }
        [[nodiscard]] UBIN_FORCEINLINE std::optional<Int> try_int() const noexcept {
            if (is_int())
                return n_->data.i;
            return std::nullopt;
        }
        [[nodiscard]] UBIN_FORCEINLINE std::optional<std::int64_t> try_i64() const noexcept {
            if (is_int())
                return n_->data.i.to_i64();
            return std::nullopt;
        }
        [[nodiscard]] UBIN_FORCEINLINE std::optional<std::uint64_t> try_u64() const noexcept {
            if (is_int())
                return n_->data.i.to_u64();
            return std::nullopt;
        }
        [[nodiscard]] UBIN_FORCEINLINE std::optional<Float> try_float() const noexcept {
            if (is_float())
                return n_->data.f;
            return std::nullopt;
        }
        [[nodiscard]] UBIN_FORCEINLINE std::optional<double> try_f64() const noexcept {
            if (is_float())
                return n_->data.f.as_double();
            return std::nullopt;
        }
        [[nodiscard]] UBIN_FORCEINLINE std::optional<std::string_view> try_string() const noexcept {
            if (is_string())
                return n_->data.str;
            return std::nullopt;
        }
        [[nodiscard]] UBIN_FORCEINLINE std::optional<std::span<const std::uint8_t>> try_bytes() const noexcept {
            if (is_bytes())
                return n_->data.bytes;
            return std::nullopt;
        }

        [[nodiscard]] UBIN_FORCEINLINE bool as_bool(const bool def = false) const noexcept {
            return is_bool() ? n_->data.b : def;
        }
        [[nodiscard]] UBIN_FORCEINLINE std::int64_t as_i64(const std::int64_t def = 0) const noexcept {
            return try_i64().value_or(def);
        }
        [[nodiscard]] UBIN_FORCEINLINE std::uint64_t as_u64(const std::uint64_t def = 0) const noexcept {
            return try_u64().value_or(def);
        }
        [[nodiscard]] UBIN_FORCEINLINE double as_f64(const double def = 0.0) const noexcept {
            return is_float() ? n_->data.f.as_double() : def;
        }
        [[nodiscard]] UBIN_FORCEINLINE std::string_view as_string(const std::string_view def = {}) const noexcept {
            return is_string() ? n_->data.str : def;
        }
        [[nodiscard]] UBIN_FORCEINLINE std::span<const std::uint8_t> as_bytes() const noexcept {
            return is_bytes() ? n_->data.bytes : std::span<const std::uint8_t> {};
        }

        // Seq: element count. Map: entry count.
        [[nodiscard]] UBIN_FORCEINLINE std::uint32_t size() const noexcept {
            if (is_seq())
                return n_->data.seq.count;
            if (is_map())
                return n_->data.map.count;
            return 0;
        }

        [[nodiscard]] UBIN_FORCEINLINE bool empty() const noexcept {
            return size() == 0;
        }

        [[nodiscard]] UBIN_FORCEINLINE MapOrder map_order() const noexcept {
            return is_map() ? n_->order : MapOrder::Insertion;
        }

        [[nodiscard]] UBIN_FORCEINLINE ValueRef at(const std::uint32_t i) const noexcept {
            if (!is_seq() || i >= n_->data.seq.count)
                return {};
            return {n_->data.seq.items[i], arena_};
        }

        [[nodiscard]] UBIN_FORCEINLINE ValueRef operator[](const std::uint32_t i) const noexcept {
            return at(i);
        }

        [[nodiscard]] ValueRef find(const ValueRef key) const noexcept {
            if (!is_map() || !key.n_)
                return {};
            const MapEntry* e = find_entry(*n_, *key.n_);
            return e ? ValueRef {e->value, arena_} : ValueRef {};
        }

        [[nodiscard]] ValueRef get(const std::string_view key) const noexcept {
            Node k;
            k.type = Type::String;
            k.data.str = key;
            return find(ValueRef {&k, nullptr});
        }

        [[nodiscard]] ValueRef get(const Int key) const noexcept {
            Node k;
            k.type = Type::Int;
            k.data.i = key;
            return find(ValueRef {&k, nullptr});
        }

        [[nodiscard]] UBIN_FORCEINLINE ValueRef operator[](const std::string_view key) const noexcept {
            return get(key);
        }

        [[nodiscard]] UBIN_FORCEINLINE bool contains(const std::string_view key) const noexcept {
            return get(key).valid();
        }

        struct SeqIter {
            Node* const* p {};
            Arena* arena {};

            [[nodiscard]] ValueRef operator*() const noexcept {
                return {*p, arena};
            }
            SeqIter& operator++() noexcept {
                ++p;
                return *this;
            }
            [[nodiscard]] bool operator==(const SeqIter& o) const noexcept {
                return p == o.p;
            }
        };

        struct SeqRange {
            Node* const* first {};
            Node* const* last {};
            Arena* arena {};

            [[nodiscard]] SeqIter begin() const noexcept {
                return {first, arena};
            }
            [[nodiscard]] SeqIter end() const noexcept {
                return {last, arena};
            }
        };

        struct Member;

        struct MapMemberIter {
            MapIter it {};
            Arena* arena {};

            [[nodiscard]] Member operator*() const noexcept;
            MapMemberIter& operator++() noexcept {
                ++it;
                return *this;
            }
            [[nodiscard]] bool operator==(const MapMemberIter& o) const noexcept {
                return it == o.it;
            }
        };

        struct MapRange {
            MapEntries entries {};
            Arena* arena {};

            [[nodiscard]] MapMemberIter begin() const noexcept {
                return {entries.begin(), arena};
            }
            [[nodiscard]] MapMemberIter end() const noexcept {
                return {entries.end(), arena};
            }
        };

        [[nodiscard]] SeqRange items() const noexcept {
            if (!is_seq() || !n_->data.seq.items)
                return {};
            return {n_->data.seq.items, n_->data.seq.items + n_->data.seq.count, arena_};
        }

        // Insertion order for insertion-ordered maps, slot order otherwise.
        [[nodiscard]] MapRange members() const noexcept {
            if (!is_map())
                return {};
            return {map_entries(*n_), arena_};
        }

        [[nodiscard]] friend bool operator==(const ValueRef a, const ValueRef b) noexcept {
            if (!a.n_ || !b.n_)
                return a.n_ == b.n_;
            return equal_nodes(*a.n_, *b.n_);
        }

    private:
        const Node* n_ {};
        Arena* arena_ {};
    };

    struct ValueRef::Member {
        ValueRef key;
        ValueRef value;
    };

    inline ValueRef::Member ValueRef::MapMemberIter::operator*() const noexcept {
        return {ValueRef {it->key, arena}, ValueRef {it->value, arena}};
    }

    // Total order over values; agrees with operator==.
    [[nodiscard]] inline int compare(const ValueRef a, const ValueRef b) noexcept {
        if (!a.valid() || !b.valid())
            return a.valid() == b.valid() ? 0 : (a.valid() ? 1 : -1);
        return compare_nodes(*a.raw(), *b.raw());
    }

    [[nodiscard]] inline std::uint64_t hash_value(const ValueRef v) noexcept {
        return v.valid() ? hash_node(*v.raw()) : 0;
    }

    // A scalar value as exchanged by the streaming primitives.
    struct Scalar {
        Type type {Type::Null};
        bool b {};
        Int i {};
        Float f {};
        std::span<const std::uint8_t> bytes {};
        std::string_view str {};

        static constexpr Scalar null() noexcept {
            return {};
        }
        static constexpr Scalar unit() noexcept {
            return {.type = Type::Unit};
        }
        static constexpr Scalar boolean(const bool v) noexcept {
            return {.type = Type::Bool, .b = v};
        }
        static constexpr Scalar integer(const std::int64_t v) noexcept {
            return {.type = Type::Int, .i = Int::from_i64(v)};
        }
        static constexpr Scalar uinteger(const std::uint64_t v) noexcept {
            return {.type = Type::Int, .i = Int::from_u64(v)};
        }
        static constexpr Scalar f32(const float v) noexcept {
            return {.type = Type::Float, .f = Float::from_f32(v)};
        }
        static constexpr Scalar f64(const double v) noexcept {
            return {.type = Type::Float, .f = Float::from_f64(v)};
        }
        static constexpr Scalar blob(const std::span<const std::uint8_t> v) noexcept {
            return {.type = Type::Bytes, .bytes = v};
        }
        static constexpr Scalar string(const std::string_view v) noexcept {
            return {.type = Type::String, .str = v};
        }
    };

    struct Options {
        std::uint32_t max_depth {kDefaultMaxDepth};
        bool preserve_order {true};
        bool strict_duplicate_keys {false};
        bool allow_alloc {true};
        StringPolicy strings {StringPolicy::Copy};
        bool reject_trailing {false};
        bool pack_floats {false};
    };

    // Nesting budget for one decode or encode call.
    class DepthGuard {
    public:
        explicit constexpr DepthGuard(const std::uint32_t max_depth = kDefaultMaxDepth) noexcept: max_(max_depth) { }

        [[nodiscard]] UBIN_FORCEINLINE constexpr bool enter() noexcept {
            if (!unbounded() && depth_ >= max_)
                return false;
            ++depth_;
            return true;
        }

        // Returns false when no container is open.
        [[nodiscard]] UBIN_FORCEINLINE constexpr bool leave() noexcept {
            if (depth_ == 0)
                return false;
            --depth_;
            return true;
        }

        [[nodiscard]] constexpr std::size_t depth() const noexcept {
            return depth_;
        }

        [[nodiscard]] constexpr std::uint32_t max_depth() const noexcept {
            return max_;
        }

        [[nodiscard]] constexpr bool unbounded() const noexcept {
            return max_ == kUnboundedDepth;
        }

        [[nodiscard]] constexpr std::size_t remaining() const noexcept {
            if (unbounded())
                return std::numeric_limits<std::size_t>::max();
            return depth_ >= max_ ? 0 : max_ - depth_;
        }

    private:
        std::uint32_t max_;
        std::size_t depth_ {};
    };

} // namespace ubin

namespace ubin {

    // ---- sinks ----

    template <class S>
    concept ByteSink = requires(S& s, const std::uint8_t* p, std::size_t n) {
        { S::kGrowable } -> std::convertible_to<bool>;
        { s.write(p, n) } -> std::same_as<bool>;
        { s.size() } -> std::convertible_to<std::size_t>;
    };

    // Caller-provided buffer; a write that does not fit is rejected whole.
    struct FixedBufferSink {
        static constexpr bool kGrowable = false;

        std::uint8_t* buf {};
        std::size_t cap {};
        std::size_t pos {};

        FixedBufferSink() = default;
        FixedBufferSink(std::uint8_t* b, const std::size_t c) noexcept: buf(b), cap(c) { }
        explicit FixedBufferSink(const std::span<std::uint8_t> out) noexcept: buf(out.data()), cap(out.size()) { }

        [[nodiscard]] UBIN_FORCEINLINE bool write(const std::uint8_t* p, const std::size_t n) noexcept {
            if (n > cap - pos)
                return false;
            if (n)
                std::memcpy(buf + pos, p, n);
            pos += n;
            return true;
        }

        [[nodiscard]] UBIN_FORCEINLINE std::size_t size() const noexcept {
            return pos;
        }

        [[nodiscard]] UBIN_FORCEINLINE std::span<const std::uint8_t> finish() const noexcept {
            return {buf, pos};
        }
    };

    struct VectorSink {
        static constexpr bool kGrowable = true;

        std::vector<std::uint8_t> out;

        [[nodiscard]] UBIN_FORCEINLINE bool write(const std::uint8_t* p, const std::size_t n) {
            out.insert(out.end(), p, p + n);
            return true;
        }

        [[nodiscard]] UBIN_FORCEINLINE std::size_t size() const noexcept {
            return out.size();
        }

        [[nodiscard]] UBIN_FORCEINLINE std::vector<std::uint8_t> finish() {
            return std::move(out);
        }
    };

    static_assert(ByteSink<FixedBufferSink>);
    static_assert(ByteSink<VectorSink>);

    inline constexpr std::size_t kMaxStreamDepth = 256;

    // Streaming writer. Scalars and container headers go straight to the sink;
    // open containers are tracked so that element counts match what was declared.
    template <ByteSink Sink>
    class Encoder {
    public:
        explicit Encoder(Sink& sink, const Options& opt = {}): sink_(sink), opt_(opt) {
            if constexpr (Sink::kGrowable) {
                if (!opt_.allow_alloc)
                    err_.set(ErrorCode::AllocationDisallowed, 0);
            }
        }

        [[nodiscard]] UBIN_FORCEINLINE const Error& error() const noexcept {
            return err_;
        }

        [[nodiscard]] UBIN_FORCEINLINE bool ok() const noexcept {
            return err_.ok();
        }

        [[nodiscard]] UBIN_FORCEINLINE std::size_t written() const noexcept {
            return sink_.size();
        }

        [[nodiscard]] UBIN_FORCEINLINE std::size_t open_containers() const noexcept {
            return top_;
        }

        // True once every opened container has been closed.
        [[nodiscard]] UBIN_FORCEINLINE bool complete() const noexcept {
            return err_.ok() && top_ == 0;
        }

        // Raw header without element bookkeeping.
        [[nodiscard]] bool write_header(const Header& h) {
            if (!err_.ok())
                return false;
            std::uint8_t tmp[9];
            return put(tmp, write_header_to(tmp, h));
        }

        // Raw payload bytes without element bookkeeping.
        [[nodiscard]] bool write_raw(const std::span<const std::uint8_t> bytes) {
            if (!err_.ok())
                return false;
            return put(bytes.data(), bytes.size());
        }

        [[nodiscard]] bool write_scalar(const Scalar& s) {
            switch (s.type) {
            case Type::Null:
                return write_null();
            case Type::Unit:
                return write_unit();
            case Type::Bool:
                return write_bool(s.b);
            case Type::Int:
                return write_integer(s.i);
            case Type::Float:
                return s.f.width == FloatWidth::F32 ? write_f32(s.f.f) : write_f64(s.f.d);
            case Type::Bytes:
                return write_bytes(s.bytes);
            case Type::String:
                return write_string(s.str);
            case Type::Seq:
            case Type::Map:
                break;
            }
            return fail(ErrorCode::TypeMismatch);
        }

        [[nodiscard]] bool write_null() {
            return element() && emit(Header::null());
        }

        [[nodiscard]] bool write_unit() {
            return element() && emit(Header::unit());
        }

        [[nodiscard]] bool write_bool(const bool v) {
            return element() && emit(Header::boolean(v));
        }

        [[nodiscard]] bool write_int(const std::int64_t v) {
            return write_integer(Int::from_i64(v));
        }

        [[nodiscard]] bool write_uint(const std::uint64_t v) {
            return write_integer(Int::from_u64(v));
        }

        [[nodiscard]] bool write_integer(const Int& v) {
            return element() && emit(Header::integer(v));
        }

        [[nodiscard]] bool write_f32(const float v) {
            if (!element())
                return false;
            std::uint8_t tmp[5];
            const std::size_t n = write_header_to(tmp, Header::f32());
            detail::store_be(tmp + n, std::bit_cast<std::uint32_t>(canonicalize(v)), 4);
            return put(tmp, n + 4);
        }

        [[nodiscard]] bool write_f64(const double v) {
            if (opt_.pack_floats && fits_f32(v))
                return write_f32(static_cast<float>(v));
            if (!element())
                return false;
            std::uint8_t tmp[9];
            const std::size_t n = write_header_to(tmp, Header::f64());
            detail::store_be(tmp + n, std::bit_cast<std::uint64_t>(canonicalize(v)), 8);
            return put(tmp, n + 8);
        }

        [[nodiscard]] bool write_bytes(const std::span<const std::uint8_t> v) {
            return element() && emit(Header::bytes(v.size())) && put(v.data(), v.size());
        }

        [[nodiscard]] bool write_string(const std::string_view v) {
            if (!detail::validate_utf8(v))
                return fail(ErrorCode::InvalidUtf8);
            return element() && emit(Header::string(v.size())) && put(reinterpret_cast<const std::uint8_t*>(v.data()), v.size());
        }

        [[nodiscard]] bool begin_seq(const std::uint64_t n) {
            return begin(Header::seq(n), n);
        }

        [[nodiscard]] bool begin_map(const std::uint64_t n) {
            return begin(Header::map(n), n * 2u);
        }

        [[nodiscard]] bool end_container() {
            if (!err_.ok())
                return false;
            if (top_ == 0)
                return fail(ErrorCode::ContainerUnderflow);
            if (frames_[top_ - 1] != 0)
                return fail(ErrorCode::LengthMismatch);
            --top_;
            return true;
        }

        // Writes a whole tree. Hashed maps are written in canonical key order.
        // Its nesting starts below the containers already open on the stream.
        [[nodiscard]] bool write(const ValueRef v) {
            if (!v.valid())
                return write_null();
            return write_node(*v.raw(), top_);
        }

    private:
        [[nodiscard]] static UBIN_FORCEINLINE std::size_t write_header_to(std::uint8_t* out, const Header& h) noexcept {
            return ubin::write_header(out, h);
        }

        UBIN_FORCEINLINE bool fail(const ErrorCode c) noexcept {
            err_.set(c, sink_.size());
            return false;
        }

        [[nodiscard]] UBIN_FORCEINLINE bool put(const std::uint8_t* p, const std::size_t n) {
            if (!sink_.write(p, n))
                return fail(ErrorCode::BufferCapacityExceeded);
            return true;
        }

        [[nodiscard]] UBIN_FORCEINLINE bool emit(const Header& h) {
            std::uint8_t tmp[9];
            return put(tmp, write_header_to(tmp, h));
        }

        // Accounts for one element in the innermost open container.
        [[nodiscard]] UBIN_FORCEINLINE bool element() noexcept {
            if (!err_.ok())
                return false;
            if (top_ == 0 || tree_depth_ > 0)
                return true;
            if (frames_[top_ - 1] == 0)
                return fail(ErrorCode::LengthMismatch);
            --frames_[top_ - 1];
            return true;
        }

        [[nodiscard]] bool begin(const Header& h, const std::uint64_t slots) {
            if (h.value > kMaxContainerCount)
                return fail(ErrorCode::LengthOverflow);
            if (top_ == kMaxStreamDepth || (opt_.max_depth != kUnboundedDepth && top_ >= opt_.max_depth))
                return fail(ErrorCode::DepthExceeded);
            if (!element() || !emit(h))
                return false;
            frames_[top_++] = slots;
            return true;
        }

        [[nodiscard]] bool write_node(const Node& n, const std::size_t depth) {
            switch (n.type) {
            case Type::Null:
                return write_null();
            case Type::Unit:
                return write_unit();
            case Type::Bool:
                return write_bool(n.data.b);
            case Type::Int:
                return write_integer(n.data.i);
            case Type::Float:
                return n.data.f.width == FloatWidth::F32 ? write_f32(n.data.f.f) : write_f64(n.data.f.d);
            case Type::Bytes:
                return write_bytes(n.data.bytes);
            case Type::String:
                return write_string(n.data.str);
            case Type::Seq:
            case Type::Map:
                break;
            }

            if (opt_.max_depth != kUnboundedDepth && depth >= opt_.max_depth)
                return fail(ErrorCode::DepthExceeded);
            if (!element())
                return false;

            ++tree_depth_;
            const bool done = write_children(n, depth);
            --tree_depth_;
            return done;
        }

        [[nodiscard]] bool write_children(const Node& n, const std::size_t depth) {
            if (n.type == Type::Seq) {
                if (!emit(Header::seq(n.data.seq.count)))
                    return false;
                for (std::uint32_t i = 0; i < n.data.seq.count; ++i) {
                    if (!write_node(*n.data.seq.items[i], depth + 1))
                        return false;
                }
                return true;
            }

            if (!emit(Header::map(n.data.map.count)))
                return false;

            if (n.order == MapOrder::Insertion) {
                for (const auto& e : map_entries(n)) {
                    if (!write_node(*e.key, depth + 1) || !write_node(*e.value, depth + 1))
                        return false;
                }
                return true;
            }
            return write_canonical(n, depth);
        }

        [[nodiscard]] bool write_canonical(const Node& n, const std::size_t depth) {
            if (opt_.allow_alloc) {
                std::vector<const MapEntry*> sorted;
                bool have_scratch = true;
                try {
                    sorted.reserve(n.data.map.count);
                } catch (const std::bad_alloc&) {
                    have_scratch = false;
                }

                if (have_scratch) {
                    for (const auto& e : map_entries(n))
                        sorted.push_back(&e);
                    std::sort(sorted.begin(), sorted.end(), [](const MapEntry* a, const MapEntry* b) { return compare_nodes(*a->key, *b->key) < 0; });
                    for (const MapEntry* e : sorted) {
                        if (!write_node(*e->key, depth + 1) || !write_node(*e->value, depth + 1))
                            return false;
                    }
                    return true;
                }
            }

            for (const MapEntry* e = detail::next_entry_after(n, nullptr); e; e = detail::next_entry_after(n, e->key)) {
                if (!write_node(*e->key, depth + 1) || !write_node(*e->value, depth + 1))
                    return false;
            }
            return true;
        }

        Sink& sink_; // NOLINT
        Options opt_;
        Error err_ {};
        std::array<std::uint64_t, kMaxStreamDepth> frames_ {};
        std::size_t top_ {};
        std::size_t tree_depth_ {};
    };

    struct EncodeResult {
        std::size_t written {};
        Error error {};

        [[nodiscard]] UBIN_FORCEINLINE bool ok() const noexcept {
            return error.ok();
        }
    };

    template <ByteSink Sink>
    [[nodiscard]] EncodeResult encode(const ValueRef v, Sink& sink, const Options& opt = {}) {
        const std::size_t start = sink.size();
        Encoder<Sink> enc(sink, opt);
        if (!enc.write(v))
            return {.written = sink.size() - start, .error = enc.error()};
        return {.written = sink.size() - start};
    }

    // Encodes into a caller buffer; fails with BufferCapacityExceeded when it is too small.
    [[nodiscard]] inline EncodeResult encode(const ValueRef v, const std::span<std::uint8_t> out, const Options& opt = {}) {
        FixedBufferSink sink {out};
        return encode(v, sink, opt);
    }

    [[nodiscard]] inline std::vector<std::uint8_t> encode(const ValueRef v, const Options& opt, Error* err) {
        VectorSink sink;
        const auto r = encode(v, sink, opt);
        if (err)
            *err = r.error;
        if (!r.ok())
            return {};
        return sink.finish();
    }

    [[nodiscard]] inline std::vector<std::uint8_t> encode(const ValueRef v, const Options& opt = {}) {
        return encode(v, opt, nullptr);
    }

} // namespace ubin

namespace ubin {

    // Reads the payload of a scalar header h that started at offset at.
    // Container headers fail with TypeMismatch.
    [[nodiscard]] inline bool read_scalar(const std::span<const std::uint8_t> in, std::size_t& pos, const std::size_t at, const Header& h, Scalar& out, Error& err) noexcept {
        const std::size_t left = in.size() - pos;

        switch (h.marker) {
        case Marker::Null:
            out = Scalar::null();
            return true;
        case Marker::Unit:
            out = Scalar::unit();
            return true;
        case Marker::Bool:
            out = Scalar::boolean(h.flag);
            return true;
        case Marker::Int:
            out = h.flag ? Scalar::integer(detail::zigzag_decode(h.value)) : Scalar::uinteger(h.value);
            return true;

        case Marker::Float: {
            if (left < h.width) {
                err.set(ErrorCode::UnexpectedEof, in.size());
                return false;
            }
            const auto bits = detail::load_be(in.data() + pos, h.width);
            pos += h.width;
            if (h.width == 4)
                out = Scalar::f32(std::bit_cast<float>(static_cast<std::uint32_t>(bits)));
            else
                out = Scalar::f64(std::bit_cast<double>(bits));
            return true;
        }

        case Marker::Bytes:
        case Marker::String: {
            if (h.value > left) {
                err.set(ErrorCode::UnexpectedEof, in.size());
                return false;
            }
            const auto len = static_cast<std::size_t>(h.value);
            const std::uint8_t* p = in.data() + pos;
            if (h.marker == Marker::String) {
                if (!detail::validate_utf8(p, p + len)) {
                    err.set(ErrorCode::InvalidUtf8, at);
                    return false;
                }
                out = Scalar::string(std::string_view {reinterpret_cast<const char*>(p), len});
            } else {
                out = Scalar::blob(std::span<const std::uint8_t> {p, len});
            }
            pos += len;
            return true;
        }

        case Marker::Seq:
        case Marker::Map:
            break;
        }

        err.set(ErrorCode::TypeMismatch, at);
        return false;
    }

    // Pull decoder: the caller walks the input one header at a time.
    // Errors are sticky; after the first failure every call returns false.
    class Reader {
    public:
        explicit Reader(const std::span<const std::uint8_t> in, const Options& opt = {}) noexcept: in_(in), guard_(opt.max_depth) { }

        [[nodiscard]] UBIN_FORCEINLINE std::size_t pos() const noexcept {
            return pos_;
        }
        [[nodiscard]] UBIN_FORCEINLINE std::size_t remaining() const noexcept {
            return in_.size() - pos_;
        }
        [[nodiscard]] UBIN_FORCEINLINE bool at_end() const noexcept {
            return pos_ >= in_.size();
        }
        [[nodiscard]] UBIN_FORCEINLINE std::size_t depth() const noexcept {
            return guard_.depth();
        }
        [[nodiscard]] UBIN_FORCEINLINE const Error& error() const noexcept {
            return err_;
        }
        [[nodiscard]] UBIN_FORCEINLINE bool ok() const noexcept {
            return err_.ok();
        }

        [[nodiscard]] std::optional<Marker> peek_marker() const noexcept {
            if (!err_.ok() || at_end())
                return std::nullopt;
            return detect_marker(in_[pos_]);
        }

        [[nodiscard]] bool read_header(Header& h) noexcept {
            if (!err_.ok())
                return false;
            header_at_ = pos_;
            return ubin::read_header(in_, pos_, h, err_);
        }

        [[nodiscard]] bool read_scalar(const Header& h, Scalar& out) noexcept {
            if (!err_.ok())
                return false;
            return ubin::read_scalar(in_, pos_, header_at_, h, out, err_);
        }

        [[nodiscard]] bool read_scalar(Scalar& out) noexcept {
            Header h;
            return read_header(h) && read_scalar(h, out);
        }

        [[nodiscard]] bool read_null() noexcept {
            Header h;
            return expect(Marker::Null, h);
        }

        [[nodiscard]] bool read_unit() noexcept {
            Header h;
            return expect(Marker::Unit, h);
        }

        [[nodiscard]] bool read_bool(bool& out) noexcept {
            Header h;
            if (!expect(Marker::Bool, h))
                return false;
            out = h.flag;
            return true;
        }

        [[nodiscard]] bool read_integer(Int& out) noexcept {
            Header h;
            if (!expect(Marker::Int, h))
                return false;
            out = h.flag ? Int::from_i64(detail::zigzag_decode(h.value)) : Int::from_u64(h.value);
            return true;
        }

        [[nodiscard]] bool read_int(std::int64_t& out) noexcept {
            Int v;
            if (!read_integer(v))
                return false;
            const auto r = v.to_i64();
            if (!r)
                return fail(ErrorCode::NumberOutOfRange, header_at_);
            out = *r;
            return true;
        }

        [[nodiscard]] bool read_uint(std::uint64_t& out) noexcept {
            Int v;
            if (!read_integer(v))
                return false;
            const auto r = v.to_u64();
            if (!r)
                return fail(ErrorCode::NumberOutOfRange, header_at_);
            out = *r;
            return true;
        }

        // Accepts either float width.
        [[nodiscard]] bool read_f64(double& out) noexcept {
            Header h;
            Scalar s;
            if (!expect(Marker::Float, h) || !read_scalar(h, s))
                return false;
            out = s.f.as_double();
            return true;
        }

        [[nodiscard]] bool read_string(std::string_view& out) noexcept {
            Header h;
            Scalar s;
            if (!expect(Marker::String, h) || !read_scalar(h, s))
                return false;
            out = s.str;
            return true;
        }

        [[nodiscard]] bool read_bytes(std::span<const std::uint8_t>& out) noexcept {
            Header h;
            Scalar s;
            if (!expect(Marker::Bytes, h) || !read_scalar(h, s))
                return false;
            out = s.bytes;
            return true;
        }

        [[nodiscard]] bool begin_seq(std::uint64_t& count) noexcept {
            return begin(Marker::Seq, count);
        }

        [[nodiscard]] bool begin_map(std::uint64_t& count) noexcept {
            return begin(Marker::Map, count);
        }

        [[nodiscard]] bool end_container() noexcept {
            if (!err_.ok())
                return false;
            if (!guard_.leave())
                return fail(ErrorCode::ContainerUnderflow, pos_);
            return true;
        }

        // Skips one complete value without recursion.
        [[nodiscard]] bool skip_value() noexcept {
            std::uint64_t pending = 1;
            while (pending) {
                --pending;
                Header h;
                if (!read_header(h))
                    return false;
                if (h.is_container()) {
                    const std::uint64_t slots = h.marker == Marker::Map ? h.value * 2u : h.value;
                    if (slots > remaining()) {
                        err_.set(ErrorCode::UnexpectedEof, in_.size());
                        return false;
                    }
                    pending += slots;
                    continue;
                }
                Scalar s;
                if (!read_scalar(h, s))
                    return false;
            }
            return true;
        }

    private:
        UBIN_FORCEINLINE bool fail(const ErrorCode c, const std::size_t at) noexcept {
            err_.set(c, at);
            return false;
        }

        // On a kind mismatch the position is left at the offending header.
        [[nodiscard]] bool expect(const Marker m, Header& h) noexcept {
            const std::size_t start = pos_;
            if (!read_header(h))
                return false;
            if (h.marker != m) {
                pos_ = start;
                return fail(ErrorCode::TypeMismatch, start);
            }
            return true;
        }

        [[nodiscard]] bool begin(const Marker m, std::uint64_t& count) noexcept {
            Header h;
            if (!expect(m, h))
                return false;
            if (!guard_.enter())
                return fail(ErrorCode::DepthExceeded, header_at_);
            const std::uint64_t slots = m == Marker::Map ? h.value * 2u : h.value;
            if (slots > remaining()) {
                err_.set(ErrorCode::UnexpectedEof, in_.size());
                return false;
            }
            count = h.value;
            return true;
        }

        std::span<const std::uint8_t> in_;
        std::size_t pos_ {};
        std::size_t header_at_ {};
        DepthGuard guard_;
        Error err_ {};
    };

} // namespace ubin

namespace ubin {

    template <class H>
    concept SaxHandler = requires(H& h) {
        { h.on_null() } -> std::same_as<bool>;
        { h.on_unit() } -> std::same_as<bool>;
        { h.on_bool(true) } -> std::same_as<bool>;
        { h.on_int(std::int64_t {}) } -> std::same_as<bool>;
        { h.on_uint(std::uint64_t {}) } -> std::same_as<bool>;
        { h.on_f32(float {}) } -> std::same_as<bool>;
        { h.on_f64(double {}) } -> std::same_as<bool>;
        { h.on_bytes(std::span<const std::uint8_t> {}) } -> std::same_as<bool>;
        { h.on_string(std::string_view {}) } -> std::same_as<bool>;
        { h.on_seq_begin(std::uint32_t {}) } -> std::same_as<bool>;
        { h.on_seq_end() } -> std::same_as<bool>;
        { h.on_map_begin(std::uint32_t {}) } -> std::same_as<bool>;
        { h.on_map_end() } -> std::same_as<bool>;
    };

    // A handler the core can drive directly: it also provides the arena for
    // the decoder's frame stack.
    template <class H>
    concept DecodeHandler = SaxHandler<H> && requires(H& h) {
        { h.arena() } -> std::same_as<Arena&>;
    };

    // Iterative decoder core. Map entries arrive as alternating key and value
    // events; the handler sees the declared count at container begin.
    template <DecodeHandler Handler>
    class CoreDecoder {
    public:
        CoreDecoder(Handler& h, const std::span<const std::uint8_t> in, const Options& opt = {}) noexcept: h_(h), in_(in), guard_(opt.max_depth), reject_trailing_(opt.reject_trailing) { }

        [[nodiscard]] Error decode_root() {
            pos_ = 0;
            top_ = 0;

            do {
                if (!step() || !close_finished())
                    return err_;
            } while (top_ != 0);

            if (reject_trailing_ && pos_ < in_.size())
                err_.set(ErrorCode::TrailingBytes, pos_);
            return err_;
        }

        [[nodiscard]] UBIN_FORCEINLINE std::size_t consumed() const noexcept {
            return pos_;
        }

    private:
        struct Frame {
            std::uint64_t remaining; // items still expected, keys and values counted separately
            std::size_t start;
            bool map;
        };

        UBIN_FORCEINLINE bool fail(const ErrorCode c, const std::size_t at) noexcept {
            err_.set(c, at);
            return false;
        }

        [[nodiscard]] bool step() {
            if (top_)
                --frames_[top_ - 1].remaining;

            const std::size_t at = pos_;
            Header h;
            if (!read_header(in_, pos_, h, err_))
                return false;

            if (h.is_container())
                return open(h, at);

            Scalar s;
            if (!read_scalar(in_, pos_, at, h, s, err_))
                return false;
            return emit(s, at);
        }

        [[nodiscard]] bool emit(const Scalar& s, const std::size_t at) {
            bool accepted = false;
            switch (s.type) {
            case Type::Null:
                accepted = h_.on_null();
                break;
            case Type::Unit:
                accepted = h_.on_unit();
                break;
            case Type::Bool:
                accepted = h_.on_bool(s.b);
                break;
            case Type::Int:
                accepted = s.i.is_signed ? h_.on_int(s.i.i) : h_.on_uint(s.i.u);
                break;
            case Type::Float:
                accepted = s.f.width == FloatWidth::F32 ? h_.on_f32(s.f.f) : h_.on_f64(s.f.d);
                break;
            case Type::Bytes:
                accepted = h_.on_bytes(s.bytes);
                break;
            case Type::String:
                accepted = h_.on_string(s.str);
                break;
            case Type::Seq:
            case Type::Map:
                break;
            }
            return accepted || fail(ErrorCode::HandlerRejected, at);
        }

        [[nodiscard]] bool open(const Header& h, const std::size_t at) {
            const bool map = h.marker == Marker::Map;

            if (!guard_.enter())
                return fail(ErrorCode::DepthExceeded, at);

            // every item takes at least one byte
            const std::uint64_t slots = map ? h.value * 2u : h.value;
            if (slots > in_.size() - pos_)
                return fail(ErrorCode::UnexpectedEof, in_.size());

            if (!push({slots, at, map}))
                return fail(ErrorCode::BufferCapacityExceeded, at);

            const auto count = static_cast<std::uint32_t>(h.value);
            const bool accepted = map ? h_.on_map_begin(count) : h_.on_seq_begin(count);
            return accepted || fail(ErrorCode::HandlerRejected, at);
        }

        [[nodiscard]] bool close_finished() {
            while (top_ && frames_[top_ - 1].remaining == 0) {
                const Frame f = frames_[--top_];
                if (!guard_.leave())
                    return fail(ErrorCode::ContainerUnderflow, f.start);
                const bool accepted = f.map ? h_.on_map_end() : h_.on_seq_end();
                if (!accepted)
                    return fail(ErrorCode::HandlerRejected, f.start);
            }
            return true;
        }

        [[nodiscard]] bool push(const Frame& f) {
            if (top_ == cap_) {
                const std::size_t new_cap = cap_ ? cap_ * 2 : 16;
                auto* bigger = h_.arena().template make_array<Frame>(new_cap);
                if (!bigger)
                    return false;
                if (top_)
                    std::memcpy(bigger, frames_, sizeof(Frame) * top_);
                frames_ = bigger;
                cap_ = new_cap;
            }
            frames_[top_++] = f;
            return true;
        }

        Handler& h_; // NOLINT
        std::span<const std::uint8_t> in_;
        std::size_t pos_ {};
        DepthGuard guard_;
        bool reject_trailing_ {};
        Error err_ {};

        Frame* frames_ {};
        std::size_t top_ {};
        std::size_t cap_ {};
    };

    // Builds a Node tree from decoder events. Strategy picks the map layout.
    template <MapStrategy Strategy>
    class DomHandler {
    public:
        DomHandler(Arena& a, const Options& opt) noexcept
            : arena_(a), strings_(opt.strings), duplicates_(opt.strict_duplicate_keys ? DuplicateKeys::Reject : DuplicateKeys::Overwrite) { }

        [[nodiscard]] Arena& arena() const noexcept {
            return arena_;
        }

        [[nodiscard]] Node* root() const noexcept {
            return root_;
        }

        // Why the handler rejected an event, None if it never did.
        [[nodiscard]] ErrorCode error_code() const noexcept {
            return code_;
        }

        bool on_null() {
            return add(make(Type::Null));
        }

        bool on_unit() {
            return add(make(Type::Unit));
        }

        bool on_bool(const bool v) {
            Node* n = make(Type::Bool);
            if (n)
                n->data.b = v;
            return add(n);
        }

        bool on_int(const std::int64_t v) {
            Node* n = make(Type::Int);
            if (n)
                n->data.i = Int::from_i64(v);
            return add(n);
        }

        bool on_uint(const std::uint64_t v) {
            Node* n = make(Type::Int);
            if (n)
                n->data.i = Int::from_u64(v);
            return add(n);
        }

        bool on_f32(const float v) {
            Node* n = make(Type::Float);
            if (n)
                n->data.f = Float::from_f32(v);
            return add(n);
        }

        bool on_f64(const double v) {
            Node* n = make(Type::Float);
            if (n)
                n->data.f = Float::from_f64(v);
            return add(n);
        }

        bool on_bytes(const std::span<const std::uint8_t> v) {
            Node* n = make(Type::Bytes);
            if (!n)
                return add(nullptr);
            const std::uint8_t* p = store(v.data(), v.size());
            if (!p && !v.empty())
                return add(nullptr);
            n->data.bytes = std::span<const std::uint8_t> {p, v.size()};
            return add(n);
        }

        bool on_string(const std::string_view v) {
            Node* n = make(Type::String);
            if (!n)
                return add(nullptr);
            const std::uint8_t* p = store(reinterpret_cast<const std::uint8_t*>(v.data()), v.size());
            if (!p && !v.empty())
                return add(nullptr);
            n->data.str = std::string_view {reinterpret_cast<const char*>(p), v.size()};
            return add(n);
        }

        bool on_seq_begin(const std::uint32_t count) {
            Node* n = make(Type::Seq);
            if (!n)
                return add(nullptr);
            n->data.seq.count = 0;
            n->data.seq.capacity = count;
            n->data.seq.items = count ? arena_.make_array<Node*>(count) : nullptr;
            if (count && !n->data.seq.items)
                return add(nullptr);
            return open(n);
        }

        bool on_map_begin(const std::uint32_t count) {
            Node* n = make(Type::Map);
            if (!n || !Strategy::init(arena_, *n, count))
                return add(nullptr);
            return open(n);
        }

        bool on_seq_end() {
            return close();
        }

        bool on_map_end() {
            return close();
        }

    private:
        struct Frame {
            Node* node;
            Node* key; // key waiting for its value
        };

        UBIN_FORCEINLINE bool reject(const ErrorCode c) noexcept {
            if (code_ == ErrorCode::None)
                code_ = c;
            return false;
        }

        [[nodiscard]] Node* make(const Type t) {
            Node* n = arena_.make<Node>();
            if (n)
                n->type = t;
            return n;
        }

        [[nodiscard]] const std::uint8_t* store(const std::uint8_t* p, const std::size_t n) {
            if (strings_ == StringPolicy::View || n == 0)
                return p;
            auto* dst = arena_.make_array<std::uint8_t>(n);
            if (dst)
                std::memcpy(dst, p, n);
            return dst;
        }

        bool add(Node* n) {
            if (!n)
                return reject(ErrorCode::BufferCapacityExceeded);

            if (top_ == 0) {
                root_ = n;
                return true;
            }

            Frame& f = frames_[top_ - 1];
            if (f.node->type == Type::Seq) {
                auto& s = f.node->data.seq;
                if (s.count == s.capacity)
                    return reject(ErrorCode::LengthMismatch);
                s.items[s.count++] = n;
                return true;
            }

            if (!f.key) {
                f.key = n;
                // container keys are checked once complete
                return n->is_container() || check_key(f);
            }

            Node* key = f.key;
            f.key = nullptr;
            switch (Strategy::insert(arena_, *f.node, key, n, DuplicateKeys::Overwrite)) {
            case InsertResult::Inserted:
            case InsertResult::Replaced:
                return true;
            case InsertResult::Duplicate:
                return reject(ErrorCode::DuplicateKeyPolicyViolation);
            case InsertResult::OutOfMemory:
                break;
            }
            return reject(ErrorCode::BufferCapacityExceeded);
        }

        [[nodiscard]] bool check_key(const Frame& f) {
            if (duplicates_ == DuplicateKeys::Reject && Strategy::find(*f.node, *f.key, hash_node(*f.key)))
                return reject(ErrorCode::DuplicateKeyPolicyViolation);
            return true;
        }

        bool open(Node* n) {
            if (!add(n))
                return false;
            if (top_ == cap_) {
                const std::size_t new_cap = cap_ ? cap_ * 2 : 16;
                auto* bigger = arena_.make_array<Frame>(new_cap);
                if (!bigger)
                    return reject(ErrorCode::BufferCapacityExceeded);
                if (top_)
                    std::memcpy(bigger, frames_, sizeof(Frame) * top_);
                frames_ = bigger;
                cap_ = new_cap;
            }
            frames_[top_++] = Frame {n, nullptr};
            return true;
        }

        bool close() {
            if (top_ == 0)
                return reject(ErrorCode::ContainerUnderflow);
            const Node* done = frames_[--top_].node;
            if (top_ && frames_[top_ - 1].key == done)
                return check_key(frames_[top_ - 1]);
            return true;
        }

        Arena& arena_; // NOLINT
        StringPolicy strings_;
        DuplicateKeys duplicates_;
        ErrorCode code_ {ErrorCode::None};

        Node* root_ {};
        Frame* frames_ {};
        std::size_t top_ {};
        std::size_t cap_ {};
    };

    static_assert(DecodeHandler<DomHandler<OrderedMap>>);
    static_assert(DecodeHandler<DomHandler<HashedMap>>);

    // A decoded value tree together with the arena that backs it.
    class Document : ArenaHolder {
    public:
        Document() = default;

        [[nodiscard]] static Document decode(const std::span<const std::uint8_t> input, const Options& opt = {}) {
            Document doc(true);
            doc.run(input, opt, true);
            return doc;
        }

        [[nodiscard]] static Document decode(const std::span<const std::uint8_t> input, Arena& a, const Options& opt = {}) {
            Document doc(a);
            doc.run(input, opt, a.heap_backed());
            return doc;
        }

        template <AllocatorLike Allocator>
        [[nodiscard]] static Document decode(const std::span<const std::uint8_t> input, Allocator& alloc, const Options& opt = {}) {
            Document doc(alloc);
            doc.run(input, opt, is_heap_backed<Allocator>());
            return doc;
        }

        [[nodiscard]] UBIN_FORCEINLINE bool ok() const noexcept {
            return root_ != nullptr && err_.ok();
        }

        [[nodiscard]] UBIN_FORCEINLINE const Error& error() const noexcept {
            return err_;
        }

        [[nodiscard]] UBIN_FORCEINLINE ValueRef root() const noexcept {
            return ValueRef {root_, arena_};
        }

        // Bytes taken by the decoded value; the next value of a concatenated
        // stream starts here.
        [[nodiscard]] UBIN_FORCEINLINE std::size_t consumed() const noexcept {
            return consumed_;
        }

        [[nodiscard]] UBIN_FORCEINLINE std::span<const std::uint8_t> input() const noexcept {
            return input_;
        }

    private:
        using ArenaHolder::ArenaHolder;

        bool run(const std::span<const std::uint8_t> input, const Options& opt, const bool heap_backed) {
            input_ = input;
            if (!opt.allow_alloc && heap_backed) {
                err_.set(ErrorCode::AllocationDisallowed, 0);
                return false;
            }
            if (opt.preserve_order)
                return run_with<OrderedMap>(opt);
            return run_with<HashedMap>(opt);
        }

        template <MapStrategy Strategy>
        bool run_with(const Options& opt) {
            DomHandler<Strategy> builder(arena(), opt);
            CoreDecoder<DomHandler<Strategy>> d(builder, input_, opt);

            err_ = d.decode_root();
            if (err_.code == ErrorCode::HandlerRejected && builder.error_code() != ErrorCode::None)
                err_.code = builder.error_code();
            consumed_ = d.consumed();

            if (!err_.ok())
                return false;

            root_ = builder.root();
            return true;
        }

        Node* root_ {};
        Error err_ {};
        std::size_t consumed_ {};
        std::span<const std::uint8_t> input_ {};
    };

    [[nodiscard]] inline Document decode(const std::span<const std::uint8_t> input, const Options& opt = {}) {
        return Document::decode(input, opt);
    }

    // Push decoder: forwards events to a user handler without building a tree.
    template <SaxHandler Handler>
    class SaxDecoder : ArenaHolder {
    public:
        SaxDecoder(Handler& h, const std::span<const std::uint8_t> in, const Options& opt = {}): ArenaHolder {true}, h_(h), in_(in), opt_(opt), heap_backed_(true) { }

        SaxDecoder(Handler& h, const std::span<const std::uint8_t> in, Arena& a, const Options& opt = {}): ArenaHolder {a}, h_(h), in_(in), opt_(opt), heap_backed_(a.heap_backed()) { }

        template <AllocatorLike Allocator>
        SaxDecoder(Handler& h, const std::span<const std::uint8_t> in, Allocator& alloc, const Options& opt = {})
            : ArenaHolder {alloc}, h_(h), in_(in), opt_(opt), heap_backed_(is_heap_backed<Allocator>()) { }

        [[nodiscard]] Error decode() {
            if (!opt_.allow_alloc && heap_backed_) {
                Error e;
                e.set(ErrorCode::AllocationDisallowed, 0);
                return e;
            }
            SaxAdapter a {h_, *arena_};
            CoreDecoder<SaxAdapter> d(a, in_, opt_);
            const Error e = d.decode_root();
            consumed_ = d.consumed();
            return e;
        }

        [[nodiscard]] UBIN_FORCEINLINE std::size_t consumed() const noexcept {
            return consumed_;
        }

    private:
        struct SaxAdapter;

        Handler& h_; // NOLINT
        std::span<const std::uint8_t> in_;
        Options opt_;
        bool heap_backed_;
        std::size_t consumed_ {};
    };

    template <SaxHandler Handler>
    struct SaxDecoder<Handler>::SaxAdapter {
        Handler& h;
        Arena& arena_ref;

        SaxAdapter(Handler& hh, Arena& a): h(hh), arena_ref(a) { }

        [[nodiscard]] Arena& arena() const {
            return arena_ref;
        }

        bool on_null() {
            return h.on_null();
        }
        bool on_unit() {
            return h.on_unit();
        }
        bool on_bool(bool v) {
            return h.on_bool(v);
        }
        bool on_int(std::int64_t v) {
            return h.on_int(v);
        }
        bool on_uint(std::uint64_t v) {
            return h.on_uint(v);
        }
        bool on_f32(float v) {
            return h.on_f32(v);
        }
        bool on_f64(double v) {
            return h.on_f64(v);
        }
        bool on_bytes(std::span<const std::uint8_t> v) {
            return h.on_bytes(v);
        }
        bool on_string(std::string_view v) {
            return h.on_string(v);
        }
        bool on_seq_begin(std::uint32_t n) {
            return h.on_seq_begin(n);
        }
        bool on_seq_end() {
            return h.on_seq_end();
        }
        bool on_map_begin(std::uint32_t n) {
            return h.on_map_begin(n);
        }
        bool on_map_end() {
            return h.on_map_end();
        }
    };

} // namespace ubin

namespace ubin {

    // Builds value trees by hand. Errors are sticky: after the first failure
    // every factory returns nullptr and push/insert return false.
    class ValueBuilder : ArenaHolder {
    public:
        explicit ValueBuilder(const Options& opt = {}): ArenaHolder {true}, opt_(opt) { }
        explicit ValueBuilder(Arena& arena, const Options& opt = {}): ArenaHolder {arena}, opt_(opt) { }

        template <AllocatorLike Allocator>
        explicit ValueBuilder(Allocator& alloc, const Options& opt = {}): ArenaHolder {alloc}, opt_(opt) { }

        [[nodiscard]] UBIN_FORCEINLINE bool ok() const noexcept {
            return err_.ok();
        }

        [[nodiscard]] UBIN_FORCEINLINE const Error& error() const noexcept {
            return err_;
        }

        using ArenaHolder::arena;

        [[nodiscard]] Node* null() {
            return make(Type::Null);
        }

        [[nodiscard]] Node* unit() {
            return make(Type::Unit);
        }

        [[nodiscard]] Node* boolean(const bool v) {
            Node* n = make(Type::Bool);
            if (n)
                n->data.b = v;
            return n;
        }

        [[nodiscard]] Node* integer(const Int& v) {
            Node* n = make(Type::Int);
            if (n)
                n->data.i = v;
            return n;
        }

        [[nodiscard]] Node* integer(const std::int64_t v) {
            return integer(Int::from_i64(v));
        }

        [[nodiscard]] Node* uinteger(const std::uint64_t v) {
            return integer(Int::from_u64(v));
        }

        [[nodiscard]] Node* f32(const float v) {
            Node* n = make(Type::Float);
            if (n)
                n->data.f = Float::from_f32(v);
            return n;
        }

        [[nodiscard]] Node* f64(const double v) {
            Node* n = make(Type::Float);
            if (n)
                n->data.f = Float::from_f64(v);
            return n;
        }

        [[nodiscard]] Node* bytes(const std::span<const std::uint8_t> v) {
            Node* n = make(Type::Bytes);
            if (!n)
                return nullptr;
            const std::uint8_t* p = store(v.data(), v.size());
            if (!p && !v.empty())
                return nullptr;
            n->data.bytes = std::span<const std::uint8_t> {p, v.size()};
            return n;
        }

        [[nodiscard]] Node* string(const std::string_view v) {
            if (!err_.ok())
                return nullptr;
            if (!detail::validate_utf8(v)) {
                err_.set(ErrorCode::InvalidUtf8, 0);
                return nullptr;
            }
            Node* n = make(Type::String);
            if (!n)
                return nullptr;
            const std::uint8_t* p = store(reinterpret_cast<const std::uint8_t*>(v.data()), v.size());
            if (!p && !v.empty())
                return nullptr;
            n->data.str = std::string_view {reinterpret_cast<const char*>(p), v.size()};
            return n;
        }

        [[nodiscard]] Node* seq(const std::uint32_t reserve = 0) {
            Node* n = make(Type::Seq);
            if (!n)
                return nullptr;
            n->data.seq.count = 0;
            n->data.seq.capacity = reserve;
            n->data.seq.items = reserve ? arena().make_array<Node*>(reserve) : nullptr;
            if (reserve && !n->data.seq.items)
                return oom();
            return n;
        }

        // Map with the order mode taken from preserve_order.
        [[nodiscard]] Node* map(const std::uint32_t reserve = 0) {
            return map(opt_.preserve_order ? MapOrder::Insertion : MapOrder::Hashed, reserve);
        }

        [[nodiscard]] Node* map(const MapOrder order, const std::uint32_t reserve = 0) {
            Node* n = make(Type::Map);
            if (!n)
                return nullptr;
            const bool ready = order == MapOrder::Insertion ? OrderedMap::init(arena(), *n, reserve) : HashedMap::init(arena(), *n, reserve);
            if (!ready)
                return oom();
            return n;
        }

        [[nodiscard]] bool push(Node* seq, Node* value) {
            if (!err_.ok() || !seq || !value)
                return false;
            if (seq->type != Type::Seq || seq->frozen) {
                err_.set(ErrorCode::TypeMismatch, 0);
                return false;
            }

            auto& s = seq->data.seq;
            if (s.count == s.capacity) {
                if (s.capacity == std::numeric_limits<std::uint32_t>::max()) {
                    err_.set(ErrorCode::LengthOverflow, 0);
                    return false;
                }
                const std::uint32_t new_cap = s.capacity < 4u ? 4u : (s.capacity > std::numeric_limits<std::uint32_t>::max() / 2u ? std::numeric_limits<std::uint32_t>::max() : s.capacity * 2u);
                auto* bigger = arena().make_array<Node*>(new_cap);
                if (!bigger) {
                    oom();
                    return false;
                }
                if (s.count)
                    std::memcpy(bigger, s.items, sizeof(Node*) * s.count);
                s.items = bigger;
                s.capacity = new_cap;
            }
            s.items[s.count++] = value;
            return true;
        }

        // With strict_duplicate_keys a repeated key fails; otherwise it
        // replaces the value and keeps the key's position.
        // A container key is frozen: later push or insert on it, or on
        // anything nested in it, fails with TypeMismatch.
        [[nodiscard]] bool insert(Node* map, Node* key, Node* value) {
            if (!err_.ok() || !map || !key || !value)
                return false;
            if (map->type != Type::Map || map->frozen) {
                err_.set(ErrorCode::TypeMismatch, 0);
                return false;
            }
            freeze(*key);

            const auto policy = opt_.strict_duplicate_keys ? DuplicateKeys::Reject : DuplicateKeys::Overwrite;
            const auto r = map->order == MapOrder::Insertion ? OrderedMap::insert(arena(), *map, key, value, policy) : HashedMap::insert(arena(), *map, key, value, policy);

            switch (r) {
            case InsertResult::Inserted:
            case InsertResult::Replaced:
                return true;
            case InsertResult::Duplicate:
                err_.set(ErrorCode::DuplicateKeyPolicyViolation, 0);
                return false;
            case InsertResult::OutOfMemory:
                break;
            }
            oom();
            return false;
        }

        [[nodiscard]] bool insert(Node* map, const std::string_view key, Node* value) {
            return insert(map, string(key), value);
        }

        void set_root(Node* n) noexcept {
            root_ = n;
        }

        [[nodiscard]] ValueRef root() const noexcept {
            return ValueRef {root_, arena_};
        }

        [[nodiscard]] ValueRef view(const Node* n) const noexcept {
            return ValueRef {n, arena_};
        }

    private:
        static void freeze(Node& n) noexcept {
            if (!n.is_container() || n.frozen)
                return;
            n.frozen = true;
            if (n.type == Type::Seq) {
                for (std::uint32_t i = 0; i < n.data.seq.count; ++i)
                    freeze(*n.data.seq.items[i]);
                return;
            }
            for (const MapEntry& e : map_entries(n)) {
                freeze(*e.key);
                freeze(*e.value);
            }
        }

        Node* oom() noexcept {
            err_.set(ErrorCode::BufferCapacityExceeded, 0);
            return nullptr;
        }

        [[nodiscard]] Node* make(const Type t) {
            if (!err_.ok())
                return nullptr;
            Node* n = arena().make<Node>();
            if (!n)
                return oom();
            n->type = t;
            return n;
        }

        [[nodiscard]] const std::uint8_t* store(const std::uint8_t* p, const std::size_t n) {
            if (opt_.strings == StringPolicy::View || n == 0)
                return p;
            auto* dst = arena().make_array<std::uint8_t>(n);
            if (!dst) {
                oom();
                return nullptr;
            }
            std::memcpy(dst, p, n);
            return dst;
        }

        Options opt_;
        Error err_ {};
        Node* root_ {};
    };

} // namespace ubin

#endif // UBIN_HPP

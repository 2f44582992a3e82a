#ifndef RELAY_HTTP_BODY_HPP
#define RELAY_HTTP_BODY_HPP

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace relay {

// ─────────────────────────────────────────────────────────────────────────────
// Body
// ─────────────────────────────────────────────────────────────────────────────
// A request payload in one of three shapes:
//
//   Absent     no payload
//   Buffered   fully materialized bytes, shared immutably so duplicates
//              are O(1)
//   Streaming  a single-consumption chunk source; once read it is gone
//
// Body is move-only. Duplicating goes through try_clone(), which refuses
// Streaming bodies instead of handing out an empty copy.

class Body {
public:
    enum class Kind {
        Absent,
        Buffered,
        Streaming
    };

    /// Pulls the next chunk; returns nullopt once the stream is exhausted.
    using ChunkReader = std::function<std::optional<std::string>()>;

    Body() = default;

    Body(const Body&) = delete;
    Body& operator=(const Body&) = delete;
    Body(Body&&) noexcept = default;
    Body& operator=(Body&&) noexcept = default;

    [[nodiscard]] static Body buffered(std::string bytes);
    [[nodiscard]] static Body streaming(ChunkReader reader);

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_absent() const noexcept { return kind_ == Kind::Absent; }
    [[nodiscard]] bool is_buffered() const noexcept { return kind_ == Kind::Buffered; }
    [[nodiscard]] bool is_streaming() const noexcept { return kind_ == Kind::Streaming; }

    /// False only for Streaming bodies.
    [[nodiscard]] bool can_replay() const noexcept {
        return kind_ != Kind::Streaming;
    }

    /// Byte view of a Buffered body; empty for the other kinds.
    [[nodiscard]] std::string_view bytes() const noexcept;

    /// Known length: the buffered size, 0 when absent, nullopt when streaming.
    [[nodiscard]] std::optional<std::size_t> size() const noexcept;

    /// nullopt for Streaming bodies.
    [[nodiscard]] std::optional<Body> try_clone() const;

    /// Materializes the payload, draining a Streaming body. Leaves *this Absent.
    [[nodiscard]] std::string take_all();

private:
    friend class BodyReplayBuffer;

    Kind kind_{Kind::Absent};
    std::shared_ptr<const std::string> bytes_;
    ChunkReader reader_;
};

// ─────────────────────────────────────────────────────────────────────────────
// BodyReplayBuffer
// ─────────────────────────────────────────────────────────────────────────────
// Captured once from the body a logical request started with. Every
// replay() hands out an identical payload regardless of what inner
// middleware later did to the Body of an earlier attempt.

class BodyReplayBuffer {
public:
    explicit BodyReplayBuffer(const Body& body);

    [[nodiscard]] bool can_replay() const noexcept {
        return kind_ != Body::Kind::Streaming;
    }

    /// A fresh Body equal to the captured one; nullopt if the original was Streaming.
    [[nodiscard]] std::optional<Body> replay() const;

private:
    Body::Kind kind_;
    std::shared_ptr<const std::string> bytes_;
};

}  // namespace relay

#endif  // RELAY_HTTP_BODY_HPP

#include "relay/http/body.hpp"

namespace relay {

Body Body::buffered(std::string bytes) {
    Body body;
    body.kind_ = Kind::Buffered;
    body.bytes_ = std::make_shared<const std::string>(std::move(bytes));
    return body;
}

Body Body::streaming(ChunkReader reader) {
    Body body;
    body.kind_ = Kind::Streaming;
    body.reader_ = std::move(reader);
    return body;
}

std::string_view Body::bytes() const noexcept {
    const bool has_bytes = (kind_ == Kind::Buffered) && (bytes_ != nullptr);
    if (has_bytes) {
        return *bytes_;
    }
    return {};
}

std::optional<std::size_t> Body::size() const noexcept {
    switch (kind_) {
        case Kind::Absent:    return 0;
        case Kind::Buffered:  return bytes_ ? bytes_->size() : 0;
        case Kind::Streaming: return std::nullopt;
    }
    return std::nullopt;
}

std::optional<Body> Body::try_clone() const {
    if (can_replay() == false) {
        return std::nullopt;
    }
    Body copy;
    copy.kind_ = kind_;
    copy.bytes_ = bytes_;
    return std::optional<Body>{std::move(copy)};
}

std::string Body::take_all() {
    std::string out;
    switch (kind_) {
        case Kind::Absent:
            break;
        case Kind::Buffered:
            if (bytes_) {
                out = *bytes_;
            }
            break;
        case Kind::Streaming:
            if (reader_) {
                while (auto chunk = reader_()) {
                    out += *chunk;
                }
            }
            break;
    }
    kind_ = Kind::Absent;
    bytes_.reset();
    reader_ = nullptr;
    return out;
}

BodyReplayBuffer::BodyReplayBuffer(const Body& body)
    : kind_(body.kind_)
    , bytes_(body.bytes_)
{}

std::optional<Body> BodyReplayBuffer::replay() const {
    switch (kind_) {
        case Body::Kind::Absent:
            return Body{};
        case Body::Kind::Buffered: {
            Body body;
            body.kind_ = Body::Kind::Buffered;
            body.bytes_ = bytes_;
            return std::optional<Body>{std::move(body)};
        }
        case Body::Kind::Streaming:
            return std::nullopt;
    }
    return std::nullopt;
}

}  // namespace relay

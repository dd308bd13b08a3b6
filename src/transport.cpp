#include "transport.hpp"
#include <algorithm>
#include <cctype>
#include "drivers/posix_serial_port.hpp"

Transport::Transport(TransportConfig cfg, SerialPortFactory factory)
    : cfg_(std::move(cfg)), factory_(std::move(factory)) {
    headless_ = is_headless_target(cfg_.target);
    if (!factory_) {
        factory_ = [] { return std::make_unique<PosixSerialPort>(); };
    }
}

bool Transport::is_headless_target(const std::string& target) {
    if (target.empty()) return true;
    if (target.size() < 4) return false;

    std::string head = target.substr(0, 4);
    std::transform(head.begin(), head.end(), head.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return head == "MOCK";
}

ErrorCode Transport::connect() {
    if (headless_) return ErrorCode::NONE;

    close();
    port_ = factory_();
    if (!port_ || !port_->open(cfg_.target, cfg_.baud)) {
        port_.reset();
        return ErrorCode::CONNECTION;
    }
    rx_.clear();
    return ErrorCode::NONE;
}

bool Transport::try_reopen_() {
    const auto now = std::chrono::steady_clock::now();
    if (now < next_reconnect_) return false;
    next_reconnect_ = now + std::chrono::milliseconds(cfg_.reconnect_interval_ms);

    if (connect() != ErrorCode::NONE) return false;
    ++reconnects_;
    return true;
}

ErrorCode Transport::send(const std::uint8_t* data, std::size_t len) {
    if (headless_) {
        ++sends_ok_;
        return ErrorCode::NONE;
    }

    if (!link_up() && !try_reopen_()) {
        ++write_errors_;
        return ErrorCode::WRITE;
    }

    if (!port_->write(data, len, cfg_.write_timeout_ms)) {
        // 끊긴 링크는 닫고 다음 tick부터 재연결 시도
        port_->close();
        port_.reset();
        next_reconnect_ = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(cfg_.reconnect_interval_ms);
        ++write_errors_;
        return ErrorCode::WRITE;
    }

    ++sends_ok_;
    return ErrorCode::NONE;
}

ErrorCode Transport::send_frame(const Frame& f) {
    const WirePacket p = encode_frame(f);
    return send(p.data(), p.size());
}

ErrorCode Transport::poll_responses() {
    if (headless_ || !cfg_.expect_ack || !link_up()) return ErrorCode::NONE;

    std::uint8_t buf[64];
    const long n = port_->read_available(buf, sizeof(buf));
    if (n <= 0) return ErrorCode::NONE;
    rx_.insert(rx_.end(), buf, buf + n);

    ErrorCode last = ErrorCode::NONE;
    std::size_t pos = 0;
    while (rx_.size() - pos >= STATUS_SIZE) {
        const ResponseStatus s = decode_status(rx_.data() + pos, STATUS_SIZE);
        if (s == ResponseStatus::OK) {
            ++acks_;
            pos += STATUS_SIZE;
        } else if (s == ResponseStatus::NAK) {
            ++naks_;
            last = ErrorCode::NAK;
            pos += STATUS_SIZE;
        } else {
            // header 틀리면 1바이트 버리고 재동기
            ++malformed_;
            last = ErrorCode::MALFORMED_RESPONSE;
            pos += (rx_[pos] == STATUS_HEADER) ? STATUS_SIZE : 1;
        }
    }
    rx_.erase(rx_.begin(), rx_.begin() + static_cast<long>(pos));
    return last;
}

void Transport::close() {
    if (port_) {
        port_->close();
        port_.reset();
    }
    rx_.clear();
}

void Transport::reset_stats() {
    sends_ok_ = 0;
    write_errors_ = 0;
    reconnects_ = 0;
    acks_ = 0;
    naks_ = 0;
    malformed_ = 0;
}

TransportDebug Transport::debug() const {
    TransportDebug d;
    d.headless = headless_;
    d.link_up = link_up();
    d.sends_ok = sends_ok_;
    d.write_errors = write_errors_;
    d.reconnects = reconnects_;
    d.acks = acks_;
    d.naks = naks_;
    d.malformed = malformed_;
    return d;
}

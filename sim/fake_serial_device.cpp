#include "fake_serial_device.hpp"
#include <chrono>
#include "../src/drivers/wire_codec.hpp"

static std::uint64_t now_us() {
    using namespace std::chrono;
    return duration_cast<microseconds>(
        steady_clock::now().time_since_epoch()
    ).count();
}

void FakeSerialDevice::set_config(const Config& cfg) {
    std::lock_guard<std::mutex> lk(mu_);
    cfg_ = cfg;
}

bool FakeSerialDevice::open(const std::string& target) {
    std::lock_guard<std::mutex> lk(mu_);
    last_target_ = target;
    if (fail_open_) return false;
    open_ = true;
    unplugged_ = false;
    ++open_count_;
    return true;
}

void FakeSerialDevice::close() {
    std::lock_guard<std::mutex> lk(mu_);
    if (!open_) return;
    open_ = false;
    ++close_count_;
    rx_.clear();
    pending_rx_.clear();
}

bool FakeSerialDevice::write(const std::uint8_t* data, std::size_t len) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!open_ || fail_writes_ || unplugged_) return false;

    WirePacket p{};
    const bool full = (len == WIRE_SIZE);
    for (std::size_t i = 0; i < len && i < WIRE_SIZE; ++i) p[i] = data[i];
    packets_.push_back(p);

    const bool valid = full && decode_frame(data, len).has_value();
    if (valid) ++valid_packets_;

    if (cfg_.reply == Reply::NONE || should_drop_()) return true;

    Pending r{};
    const std::uint64_t extra = (cfg_.jitter_us > 0) ? rand_u64_(0, cfg_.jitter_us) : 0;
    r.deliver_us = now_us() + cfg_.delay_us + extra;

    switch (cfg_.reply) {
        case Reply::ACK:
            r.bytes[0] = STATUS_HEADER;
            r.bytes[1] = valid ? STATUS_OK : STATUS_NAK;
            break;
        case Reply::NAK:
            r.bytes[0] = STATUS_HEADER;
            r.bytes[1] = STATUS_NAK;
            break;
        case Reply::GARBAGE:
            r.bytes[0] = STATUS_HEADER;
            r.bytes[1] = 0x7E;
            break;
        case Reply::NONE:
            return true;
    }
    pending_rx_.push_back(r);
    return true;
}

void FakeSerialDevice::poll_locked_(std::uint64_t now) {
    auto it = pending_rx_.begin();
    while (it != pending_rx_.end()) {
        if (it->deliver_us <= now) {
            rx_.push_back(it->bytes[0]);
            rx_.push_back(it->bytes[1]);
            it = pending_rx_.erase(it);
        } else {
            ++it;
        }
    }
}

long FakeSerialDevice::read(std::uint8_t* buf, std::size_t cap) {
    std::lock_guard<std::mutex> lk(mu_);
    if (!open_) return -1;

    poll_locked_(now_us());

    std::size_t n = 0;
    while (n < cap && !rx_.empty()) {
        buf[n++] = rx_.front();
        rx_.pop_front();
    }
    return static_cast<long>(n);
}

void FakeSerialDevice::set_fail_open(bool fail) {
    std::lock_guard<std::mutex> lk(mu_);
    fail_open_ = fail;
}

void FakeSerialDevice::set_fail_writes(bool fail) {
    std::lock_guard<std::mutex> lk(mu_);
    fail_writes_ = fail;
}

void FakeSerialDevice::unplug() {
    std::lock_guard<std::mutex> lk(mu_);
    unplugged_ = true;
}

void FakeSerialDevice::inject_rx(const std::vector<std::uint8_t>& bytes) {
    std::lock_guard<std::mutex> lk(mu_);
    rx_.insert(rx_.end(), bytes.begin(), bytes.end());
}

bool FakeSerialDevice::is_open() const {
    std::lock_guard<std::mutex> lk(mu_);
    return open_;
}

std::size_t FakeSerialDevice::packet_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return packets_.size();
}

std::size_t FakeSerialDevice::valid_packet_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return valid_packets_;
}

std::vector<WirePacket> FakeSerialDevice::packets() const {
    std::lock_guard<std::mutex> lk(mu_);
    return packets_;
}

int FakeSerialDevice::open_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return open_count_;
}

int FakeSerialDevice::close_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return close_count_;
}

std::string FakeSerialDevice::last_target() const {
    std::lock_guard<std::mutex> lk(mu_);
    return last_target_;
}

bool FakeSerialDevice::should_drop_() {
    if (cfg_.drop_rate <= 0.0) return false;
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng_) < cfg_.drop_rate;
}

std::uint64_t FakeSerialDevice::rand_u64_(std::uint64_t lo, std::uint64_t hi) {
    std::uniform_int_distribution<std::uint64_t> dist(lo, hi);
    return dist(rng_);
}

// ----- FakeSerialPort -----

bool FakeSerialPort::open(const std::string& target, std::uint32_t /*baud*/) {
    open_ = dev_->open(target);
    return open_;
}

bool FakeSerialPort::write(const std::uint8_t* data, std::size_t len, int /*timeout_ms*/) {
    if (!open_) return false;
    return dev_->write(data, len);
}

long FakeSerialPort::read_available(std::uint8_t* buf, std::size_t cap) {
    if (!open_) return -1;
    return dev_->read(buf, cap);
}

void FakeSerialPort::close() {
    if (!open_) return;
    dev_->close();
    open_ = false;
}

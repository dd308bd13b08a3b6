#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <termios.h>
#include <unistd.h>
#include <fcntl.h>

#include "scheduler.hpp"              // -Isrc
#include "fake_serial_device.hpp"     // -Isim
#include "io/frame_source.hpp"        // -Iinclude

static void set_stdin_nonblocking_raw(bool enable) {
  static termios oldt{};
  static bool saved = false;

  if (enable) {
    if (!saved) {
      tcgetattr(STDIN_FILENO, &oldt);
      saved = true;
    }
    termios newt = oldt;
    newt.c_lflag &= ~(ICANON | ECHO);     // 라인버퍼/에코 끔
    tcsetattr(STDIN_FILENO, TCSANOW, &newt);

    int flags = fcntl(STDIN_FILENO, F_GETFL, 0);
    fcntl(STDIN_FILENO, F_SETFL, flags | O_NONBLOCK);
  } else {
    if (saved) tcsetattr(STDIN_FILENO, TCSANOW, &oldt);

    int flags = fcntl(STDIN_FILENO, F_GETFL, 0);
    fcntl(STDIN_FILENO, F_SETFL, flags & ~O_NONBLOCK);
  }
}

static int read_key_nonblock() {
  unsigned char c;
  ssize_t n = read(STDIN_FILENO, &c, 1);
  if (n == 1) return c;
  return -1;
}

// =====================
// 키보드 source
// 터미널에는 key-up 이 없으므로 누른 뒤 hold_ticks 동안 유지
// =====================
class KeyboardSource final : public IFrameSource {
public:
  explicit KeyboardSource(int hold_ticks) : hold_ticks_(hold_ticks) {}

  bool read(Frame& out) override {
    int k;
    while ((k = read_key_nonblock()) != -1) on_key_(k);

    Buttons b{};
    Axes a{};
    Dpad d{};

    if (left_ > 0)  { a[LEFT_X] = -1.0; --left_; }
    if (right_ > 0) { a[LEFT_X] =  1.0; --right_; }
    if (up_ > 0)    { a[LEFT_Y] =  1.0; --up_; }
    if (down_ > 0)  { a[LEFT_Y] = -1.0; --down_; }
    if (fire_ > 0)  { a[RIGHT_TRIGGER] = 1.0; --fire_; }
    if (jump_ > 0)  { b[BTN_A] = true; --jump_; }
    if (back_ > 0)  { b[BTN_B] = true; --back_; }
    if (dup_ > 0)   { d = DpadDir::UP; --dup_; }

    out = Frame::clamped(b, a, d);
    return true;
  }

  bool quit() const { return quit_.load(); }

private:
  void on_key_(int k) {
    switch (k) {
      case 'a': case 'A': left_  = hold_ticks_; break;
      case 'd': case 'D': right_ = hold_ticks_; break;
      case 'w': case 'W': up_    = hold_ticks_; break;
      case 's': case 'S': down_  = hold_ticks_; break;
      case 'f': case 'F': fire_  = hold_ticks_; break;
      case ' ':           jump_  = hold_ticks_; break;
      case 'b': case 'B': back_  = hold_ticks_; break;
      case 'u': case 'U': dup_   = hold_ticks_; break;
      case 'q': case 'Q': quit_.store(true);    break;
      default: break;
    }
  }

  int hold_ticks_;
  int left_ = 0, right_ = 0, up_ = 0, down_ = 0;
  int fire_ = 0, jump_ = 0, back_ = 0, dup_ = 0;
  std::atomic<bool> quit_{false};
};

// usage: padlink_keyboard_demo [target=SIM|MOCK|/dev/ttyUSB0] [rate_hz=200]
int main(int argc, char** argv) {
  const std::string target = (argc > 1) ? argv[1] : "SIM";
  const double rate_hz = (argc > 2) ? std::atof(argv[2]) : 200.0;

  PipelineConfig cfg{
    .rate_hz = rate_hz,
    .fallback = FallbackPolicy::NEUTRAL,
    .transport = TransportConfig{ .target = target, .expect_ack = true },
    .observe_capacity = 16,
  };

  SerialPortFactory factory;
  std::shared_ptr<FakeSerialDevice> sim;
  if (target == "SIM") {
    sim = std::make_shared<FakeSerialDevice>(FakeSerialDevice::Config{
      .delay_us  = 2000,
      .jitter_us = 3000,
      .drop_rate = 0.01,
      .reply     = FakeSerialDevice::Reply::ACK
    });
    factory = fake_port_factory(sim);
  }

  Scheduler sched(cfg, factory);

  // 키 입력 유지 시간 ~150ms
  const int hold_ticks = std::max(1, static_cast<int>(rate_hz * 0.15));
  auto keys = std::make_shared<KeyboardSource>(hold_ticks);
  sched.add_source(keys);

  std::cout
    << "==== padlink Keyboard Demo ====\n"
    << "[W/A/S/D] left stick\n"
    << "[F] right trigger\n"
    << "[SPACE] A   [B] B   [U] dpad up\n"
    << "[Q] quit\n\n";

  set_stdin_nonblocking_raw(true);

  const ErrorCode err = sched.start();
  if (err != ErrorCode::NONE) {
    set_stdin_nonblocking_raw(false);
    std::cerr << "start failed: " << error_to_string(err) << " (target=" << target << ")\n";
    return 1;
  }

  FrameObserver obs = sched.output().attach();

  // ----- 모니터: 너무 많이 찍히면 보기 힘드니 10Hz 출력 -----
  while (!keys->quit()) {
    Frame f;
    bool any = false;
    while (obs.poll(f)) any = true;

    if (any) {
      const SchedulerStats st = sched.stats();
      std::cout
        << "lx=" << f.axis(LEFT_X)
        << " ly=" << f.axis(LEFT_Y)
        << " rt=" << f.axis(RIGHT_TRIGGER)
        << " A=" << f.button(BTN_A)
        << " B=" << f.button(BTN_B)
        << " dpad=(" << f.dpad().x << "," << f.dpad().y << ")"
        << " | sent=" << st.sends_ok
        << " ack=" << st.acks
        << " late=" << st.overruns
        << "\n";
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  sched.stop();
  set_stdin_nonblocking_raw(false);
  std::cout << "bye\n";
  return 0;
}

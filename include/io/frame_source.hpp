#pragma once
#include "../frame.hpp"

// =====================
// Source: 입력 없이 tick마다 Frame 하나 생성
// - false 반환(또는 std::exception) = 이번 tick 실패, combine에서 제외됨
// - scheduler 스레드에서 동기 호출되므로 오래 블록하면 안 됨
// =====================
class IFrameSource {
public:
    virtual ~IFrameSource() = default;
    virtual bool read(Frame& out) = 0;
};

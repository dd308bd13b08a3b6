#pragma once
#include "../frame.hpp"

// =====================
// Transform: Frame -> Frame
// - 등록 순서대로 호출, 앞 단계 출력이 입력
// - 내부 상태(이동평균 등)는 인스턴스 안에만 둔다 (tick 간 유지)
// - false 반환(또는 std::exception) = 이번 tick의 체인 중단 -> fallback
// =====================
class IFrameTransform {
public:
    virtual ~IFrameTransform() = default;
    virtual bool apply(const Frame& in, Frame& out) = 0;
};

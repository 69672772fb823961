#pragma once
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include <cstdint>
#include <vector>
namespace custodian::interfaces {
struct BlockReference {
    uint64_t height = 0;
    std::vector<uint8_t> hash;
};
class IFreshnessOracle {
public:
    virtual ~IFreshnessOracle() = default;
    [[nodiscard]] virtual Result<BlockReference, CustodyFailure> LatestBlock() = 0;
    [[nodiscard]] virtual Result<BlockReference, CustodyFailure> BlockAt(uint64_t height) = 0;
};
}

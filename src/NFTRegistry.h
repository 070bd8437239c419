#pragma once

#include "Beast.h"

class NFTRegistry {
public:
    virtual ~NFTRegistry() = default;

    // caller가 등록된 minter가 아니면 거부한다.
    virtual ItemId mint(const UserId& caller, const UserId& to, const MintedAttributes& attributes) = 0;
};

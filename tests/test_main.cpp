#include "Amount.h"
#include "BeastCatalog.h"
#include "BeastCollection.h"
#include "BeastRoller.h"
#include "GachaConfig.h"
#include "GachaEngine.h"
#include "GachaError.h"
#include "LocalRandomnessCoordinator.h"
#include "Logger.h"
#include "PriceFeed.h"
#include "PricingOracleAdapter.h"
#include "RegistryPersistence.h"
#include "SummonTokenLedger.h"
#include "Utils.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace fs = std::filesystem;

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

template <typename Fn>
void expectGachaError(GachaErrorCode code, Fn&& fn, const std::string& msg) {
    try {
        fn();
    } catch (const GachaError& ex) {
        expect(ex.code() == code, msg + " (got " + gachaErrorCodeName(ex.code()) + ")");
        return;
    } catch (const std::exception& ex) {
        expect(false, msg + " threw a non-gacha error: " + ex.what());
        return;
    }
    expect(false, msg + " did not throw");
}

const UserId kEngine = "gacha-engine";
const UserId kCoordinator = "vrf-coordinator";
const UserId kOwner = "owner";

// 2000 USD per ETH, 8 decimals
constexpr std::int64_t kEthUsd = 2000LL * 100000000LL;

Amount tokens(unsigned whole) {
    return Amount(whole) * tokenUnit();
}

struct RecordingRefunds : RefundChannel {
    int calls{0};
    Amount refunded{0};

    bool sendRefund(const UserId&, const Amount& amount) override {
        ++calls;
        refunded += amount;
        return true;
    }
};

struct RejectingRefunds : RefundChannel {
    bool sendRefund(const UserId&, const Amount&) override {
        return false;
    }
};

struct GachaFixture {
    std::shared_ptr<StaticPriceFeed> feed = std::make_shared<StaticPriceFeed>(kEthUsd);
    std::shared_ptr<PricingOracleAdapter> pricing = std::make_shared<PricingOracleAdapter>(feed);
    std::shared_ptr<const BeastCatalog> catalog = std::make_shared<const BeastCatalog>(BeastCatalog::defaultCatalog());
    SummonTokenLedger ledger{kOwner, kEngine, pricing};
    LocalRandomnessCoordinator coordinator{kCoordinator};
    BeastCollection collection{kEngine, catalog};
    GachaEngine engine{kEngine, ledger, coordinator, collection, catalog, tokens(10)};
    std::vector<GachaEvent> events;

    GachaFixture() {
        engine.subscribe([this](const GachaEvent& event) { events.push_back(event); });
    }

    void fund(const UserId& user, unsigned wholeTokens) {
        RecordingRefunds refunds;
        Amount amount = tokens(wholeTokens);
        ledger.purchase(user, pricing->quote(amount), amount, refunds);
    }
};

// pull을 항상 거절하는 장부
struct RefusingLedger : TokenLedger {
    int restores{0};

    Amount balanceOf(const UserId&) const override { return tokens(100); }
    bool pull(const UserId&, const Amount&) override { return false; }
    void burn(const Amount&) override { throw std::logic_error("burn must not be reached"); }
    void restore(const UserId&, const Amount&, const Amount&) override { ++restores; }
};

struct OfflineProvider : RandomnessProvider {
    UserId id{"offline-provider"};

    const UserId& identity() const override { return id; }
    RequestId requestRandomWords(RandomnessConsumer&, const RandomnessRequest&) override {
        throw GachaError(GachaErrorCode::RandomnessUnavailable, "provider offline");
    }
};

// 정해진 횟수만큼 실패한 뒤 실제 컬렉션에 위임한다
struct FlakyRegistry : NFTRegistry {
    FlakyRegistry(BeastCollection& target, int failures) : target(target), failuresLeft(failures) {}

    BeastCollection& target;
    int failuresLeft;
    int attempts{0};

    ItemId mint(const UserId& caller, const UserId& to, const MintedAttributes& attributes) override {
        ++attempts;
        if (failuresLeft > 0) {
            --failuresLeft;
            throw std::runtime_error("registry offline");
        }
        return target.mint(caller, to, attributes);
    }
};

template <typename Pred>
bool waitFor(Pred&& done) {
    for (int i = 0; i < 400; ++i) {
        if (done()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return done();
}

Word256 wordFrom(std::mt19937_64& rng) {
    Word256 word = 0;
    for (int i = 0; i < 4; ++i) {
        word <<= 64;
        word |= rng();
    }
    return word;
}

// ---------------------------------------------------------------------------
// Pricing

void test_quote_matches_oracle_rate() {
    auto feed = std::make_shared<StaticPriceFeed>(kEthUsd);
    PricingOracleAdapter pricing(feed);

    expect(pricing.assetPerToken() == Amount(500000000000000ULL), "rate at 2000 USD is 5e14 wei per token");
    expect(pricing.quote(tokenUnit()) == Amount(500000000000000ULL), "one token costs 5e14");
    expect(pricing.quote(tokens(3)) == Amount(1500000000000000ULL), "three tokens cost 1.5e15");
    expect(pricing.quote(parseUnits("1.5", kTokenDecimals)) == Amount(750000000000000ULL),
        "fractional amounts above one unit are priced without truncation");

    // 라운드가 바뀌면 바로 반영된다
    feed->setAnswer(4000LL * 100000000LL);
    expect(pricing.quote(tokenUnit()) == Amount(250000000000000ULL), "quote follows the live oracle answer");

    feed->setAnswer(3LL * 100000000LL);
    Amount expected = tokenUnit() * pow10(8) / Amount(300000000ULL) * tokens(7) / tokenUnit();
    expect(pricing.quote(tokens(7)) == expected, "quote == rate * amount / scale for an uneven rate");
}

void test_quote_rejects_bad_input() {
    auto feed = std::make_shared<StaticPriceFeed>(kEthUsd);
    PricingOracleAdapter pricing(feed);

    expectGachaError(GachaErrorCode::ZeroAmount, [&] { pricing.quote(0); }, "quote(0)");
    expectGachaError(GachaErrorCode::BelowMinimum, [&] { pricing.quote(tokenUnit() - 1); }, "quote below one unit");

    feed->setAnswer(0);
    expectGachaError(GachaErrorCode::InvalidPrice, [&] { pricing.quote(tokenUnit()); }, "zero oracle answer");
    feed->setAnswer(-5);
    expectGachaError(GachaErrorCode::InvalidPrice, [&] { pricing.quote(tokenUnit()); }, "negative oracle answer");
}

void test_quote_staleness_and_decimals() {
    auto feed = std::make_shared<StaticPriceFeed>(kEthUsd);
    PricingOracleAdapter strict(feed, 60);
    expect(strict.quote(tokenUnit()) == Amount(500000000000000ULL), "fresh round passes the age check");

    feed->setUpdatedAt(unixNow() - 3600);
    expectGachaError(GachaErrorCode::StalePrice, [&] { strict.quote(tokenUnit()); }, "hour-old round is stale");

    auto sixDecimals = std::make_shared<StaticPriceFeed>(2000LL * 1000000LL, 6);
    PricingOracleAdapter pricing(sixDecimals);
    expect(pricing.quote(tokenUnit()) == Amount(500000000000000ULL), "feed decimals are honoured");

    auto absurd = std::make_shared<StaticPriceFeed>(kEthUsd, 255);
    PricingOracleAdapter overflowing(absurd);
    expectGachaError(GachaErrorCode::OracleUnavailable, [&] { overflowing.quote(tokenUnit()); }, "255 feed decimals");
}

void test_http_feed_parsing() {
    PriceRound round = HttpPriceFeed::parseRound(
        R"({"jsonrpc":"2.0","result":{"roundId":"42","answer":"200000000000","updatedAt":1700000000,"decimals":8}})");
    expect(round.answer == kEthUsd, "answer read from JSON-RPC result");
    expect(round.roundId == 42, "round id read from string");
    expect(round.updatedAt == 1700000000, "updatedAt read");

    expectGachaError(GachaErrorCode::OracleUnavailable, [] { HttpPriceFeed::parseRound("not json"); }, "malformed body");
    expectGachaError(GachaErrorCode::OracleUnavailable, [] { HttpPriceFeed::parseRound(R"({"price":1})"); }, "missing answer");
    expectGachaError(GachaErrorCode::OracleUnavailable,
        [] { HttpPriceFeed::parseRound(R"({"answer":"200000000000","decimals":-1})"); }, "negative decimals");
    expectGachaError(GachaErrorCode::OracleUnavailable,
        [] { HttpPriceFeed::parseRound(R"({"answer":"200000000000","decimals":37})"); }, "too many decimals");
}

// ---------------------------------------------------------------------------
// Purchase flow

void test_purchase_exact_and_overpaid() {
    GachaFixture f;
    std::vector<GachaEvent> purchases;
    f.ledger.subscribe([&purchases](const GachaEvent& event) { purchases.push_back(event); });

    RecordingRefunds refunds;
    PurchaseReceipt exact = f.ledger.purchase("alice", Amount(500000000000000ULL), tokenUnit(), refunds);
    expect(exact.refunded == 0, "exact payment has no change");
    expect(refunds.calls == 0, "exact payment issues no refund");
    expect(f.ledger.balanceOf("alice") == tokenUnit(), "exact payment credits one token");

    PurchaseReceipt over = f.ledger.purchase("bob", Amount(500000000000100ULL), tokenUnit(), refunds);
    expect(over.refunded == Amount(100), "overpayment refunds exactly 100");
    expect(refunds.refunded == Amount(100), "refund channel received 100");
    expect(f.ledger.balanceOf("bob") == tokenUnit(), "overpaid purchase still credits one token");

    expect(f.ledger.treasury() == Amount(1000000000000000ULL), "treasury keeps only the quoted amounts");
    expect(f.ledger.totalSupply() == tokens(2), "supply grows by the purchased amounts");
    expect(purchases.size() == 2 && purchases[1].type == GachaEventType::TokenPurchased
        && purchases[1].user == "bob" && purchases[1].amount == tokenUnit(), "TokenPurchased emitted per purchase");
}

void test_purchase_failures_leave_no_trace() {
    GachaFixture f;
    RecordingRefunds refunds;
    expectGachaError(GachaErrorCode::Underpaid,
        [&] { f.ledger.purchase("alice", Amount(500000000000000ULL - 1), tokenUnit(), refunds); }, "underpaid purchase");
    expect(f.ledger.balanceOf("alice") == 0, "underpaid purchase mints nothing");

    RejectingRefunds rejecting;
    expectGachaError(GachaErrorCode::RefundFailed,
        [&] { f.ledger.purchase("alice", Amount(500000000000100ULL), tokenUnit(), rejecting); }, "refund failure");
    expect(f.ledger.balanceOf("alice") == 0, "failed refund credits nothing");
    expect(f.ledger.treasury() == 0, "failed refund keeps nothing");
    expect(f.ledger.totalSupply() == 0, "failed refund mints nothing");

    expectGachaError(GachaErrorCode::ZeroAmount, [&] { f.ledger.purchase("alice", Amount(1), 0, refunds); }, "zero purchase");
    expectGachaError(GachaErrorCode::DirectPaymentRejected,
        [&] { f.ledger.receivePayment("alice", Amount(1000)); }, "direct payment");
    expect(f.ledger.treasury() == 0, "direct payment is not kept");
}

void test_treasury_and_transfers() {
    GachaFixture f;
    f.fund("alice", 4);

    expectGachaError(GachaErrorCode::Unauthorized, [&] { f.ledger.withdrawTreasury("alice", Amount(1)); }, "non-owner withdrawal");
    expect(f.ledger.withdrawTreasury(kOwner, Amount(1000)) == Amount(1000), "owner withdraws");
    expect(f.ledger.treasury() == Amount(2000000000000000ULL - 1000), "treasury reduced by withdrawal");

    f.ledger.transfer("alice", "bob", tokens(1));
    expect(f.ledger.balanceOf("bob") == tokens(1), "transfer credits receiver");
    expectGachaError(GachaErrorCode::InsufficientFunds, [&] { f.ledger.transfer("bob", "carol", tokens(2)); }, "overdrawn transfer");
}

// ---------------------------------------------------------------------------
// Catalog

void test_catalog_validation() {
    expectGachaError(GachaErrorCode::LengthMismatch, [] { BeastCatalog({1, 2}, {1}, {"a", "b"}); }, "element list shorter");
    expectGachaError(GachaErrorCode::LengthMismatch, [] { BeastCatalog({1}, {1}, {}); }, "image list shorter");
    expectGachaError(GachaErrorCode::ZeroValue, [] { BeastCatalog({0}, {1}, {"a"}); }, "zero template id");
    expectGachaError(GachaErrorCode::ZeroValue, [] { BeastCatalog({1}, {0}, {"a"}); }, "zero element code");
    expectGachaError(GachaErrorCode::OutOfBound, [] { BeastCatalog({1}, {5}, {"a"}); }, "element code past Thunder");
    expectGachaError(GachaErrorCode::ZeroValue, [] { BeastCatalog({}, {}, {}); }, "empty catalog");
    expectGachaError(GachaErrorCode::DuplicateValue, [] { BeastCatalog({3, 3}, {1, 2}, {"a", "b"}); }, "duplicate id");

    BeastCatalog catalog({7, 3, 9}, {4, 1, 2}, {"seven", "three", "nine"});
    expect(catalog.size() == 3, "catalog keeps every entry");
    expect(catalog.templateIds() == std::vector<TemplateId>({7, 3, 9}), "selection order follows input order");
    expect(catalog.atIndex(0).element == Element::Thunder, "index 0 is template 7");
    expect(catalog.find(9) && catalog.find(9)->image == "nine", "lookup by id");
    expect(catalog.find(4) == nullptr, "unknown id has no template");
}

void test_catalog_from_json() {
    auto data = nlohmann::json::parse(R"({"templateIds":[1,2],"elements":["Nature",4],"images":["n.png","t.png"]})");
    BeastCatalog catalog = BeastCatalog::fromJson(data);
    expect(catalog.atIndex(0).element == Element::Nature, "element names accepted");
    expect(catalog.atIndex(1).element == Element::Thunder, "element codes accepted");

    auto bad = nlohmann::json::parse(R"({"templateIds":[1],"elements":["Shadow"]})");
    expectGachaError(GachaErrorCode::OutOfBound, [&] { BeastCatalog::fromJson(bad); }, "unknown element name");
    auto missing = nlohmann::json::parse(R"({"elements":[1]})");
    expectGachaError(GachaErrorCode::InvalidConfig, [&] { BeastCatalog::fromJson(missing); }, "missing id list");
}

// ---------------------------------------------------------------------------
// Attribute derivation

void test_rarity_thresholds() {
    expect(BeastRoller::rarityForRoll(1) == Rarity::Common, "1 is Common");
    expect(BeastRoller::rarityForRoll(50) == Rarity::Common, "50 is Common");
    expect(BeastRoller::rarityForRoll(51) == Rarity::Rare, "51 is Rare");
    expect(BeastRoller::rarityForRoll(80) == Rarity::Rare, "80 is Rare");
    expect(BeastRoller::rarityForRoll(81) == Rarity::Unique, "81 is Unique");
    expect(BeastRoller::rarityForRoll(95) == Rarity::Unique, "95 is Unique");
    expect(BeastRoller::rarityForRoll(96) == Rarity::Legendary, "96 is Legendary");
    expect(BeastRoller::rarityForRoll(100) == Rarity::Legendary, "100 is Legendary");
    expectGachaError(GachaErrorCode::OutOfBound, [] { BeastRoller::rarityForRoll(0); }, "roll 0");
    expectGachaError(GachaErrorCode::OutOfBound, [] { BeastRoller::rarityForRoll(101); }, "roll 101");
}

void test_derivation_is_bounded_and_deterministic() {
    auto catalog = std::make_shared<const BeastCatalog>(BeastCatalog::defaultCatalog());
    BeastRoller roller(catalog);
    std::mt19937_64 rng(7);

    for (RequestId id = 1; id <= 500; ++id) {
        Word256 word = wordFrom(rng);
        RollOutcome outcome = roller.roll(word, id);
        const auto& attr = outcome.attributes;
        expect(outcome.beastIndex < catalog->size(), "beast index within catalog");
        expect(attr.templateId == catalog->atIndex(outcome.beastIndex).templateId, "template follows index");
        expect(attr.element == catalog->atIndex(outcome.beastIndex).element, "element copied from template");
        expect(attr.hp >= kHpMin && attr.hp <= kHpMax, "hp within [15000, 65535]");
        expect(attr.attack >= kAttackMin && attr.attack <= kAttackMax, "attack within [1500, 4500]");
        expect(attr.defense >= kDefenseMin && attr.defense <= kDefenseMax, "defense within [1500, 4500]");
        expect(attr.rarity == BeastRoller::rarityForRoll(outcome.rarityRoll), "rarity follows the threshold table");

        RollOutcome again = roller.roll(word, id);
        expect(again.attributes.hp == attr.hp && again.rarityRoll == outcome.rarityRoll, "same input rolls the same beast");
    }

    // 같은 워드라도 요청 id가 다르면 시드가 달라진다
    Word256 word = 123456789;
    expect(BeastRoller::baseSeed(word, 1) != BeastRoller::baseSeed(word, 2), "request id salts the seed");

    Bytes32 seed = BeastRoller::baseSeed(word, 1);
    expect(BeastRoller::deriveInRange(seed, BeastRoller::kAttackTag, 0, 1u << 30)
        != BeastRoller::deriveInRange(seed, BeastRoller::kDefenseTag, 0, 1u << 30), "tags separate attack and defense");
    expect(BeastRoller::deriveInRange(seed, "X", 5, 5) == 5, "single-value range");
}

void test_rarity_distribution_converges() {
    auto catalog = std::make_shared<const BeastCatalog>(BeastCatalog::defaultCatalog());
    BeastRoller roller(catalog);
    std::mt19937_64 rng(2024);

    const int rolls = 20000;
    std::unordered_map<int, int> counts;
    std::vector<int> templateCounts(catalog->size(), 0);
    for (int i = 0; i < rolls; ++i) {
        RollOutcome outcome = roller.roll(wordFrom(rng), static_cast<RequestId>(i + 1));
        ++counts[static_cast<int>(outcome.attributes.rarity)];
        ++templateCounts[outcome.beastIndex];
    }

    auto share = [&](Rarity rarity) {
        return static_cast<double>(counts[static_cast<int>(rarity)]) / rolls;
    };
    auto near = [](double observed, double expected) {
        return observed > expected - 0.015 && observed < expected + 0.015;
    };
    expect(near(share(Rarity::Common), 0.50), "Common near 50%: " + std::to_string(share(Rarity::Common)));
    expect(near(share(Rarity::Rare), 0.30), "Rare near 30%: " + std::to_string(share(Rarity::Rare)));
    expect(near(share(Rarity::Unique), 0.15), "Unique near 15%: " + std::to_string(share(Rarity::Unique)));
    expect(near(share(Rarity::Legendary), 0.05), "Legendary near 5%: " + std::to_string(share(Rarity::Legendary)));

    for (size_t i = 0; i < templateCounts.size(); ++i) {
        double observed = static_cast<double>(templateCounts[i]) / rolls;
        expect(near(observed, 1.0 / catalog->size()), "template " + std::to_string(i) + " selected uniformly");
    }
}

// ---------------------------------------------------------------------------
// Engine

void test_roll_lifecycle() {
    GachaFixture f;
    f.fund("alice", 25);

    RequestId requestId = f.engine.initiateRoll("alice");
    expect(f.engine.stateOf("alice") == RollState::Rolling, "alice is Rolling after initiate");
    expect(f.ledger.balanceOf("alice") == tokens(15), "roll price pulled");
    expect(f.ledger.totalBurned() == tokens(10), "roll price burned before randomness arrives");
    expect(f.ledger.totalSupply() == tokens(15), "supply shrinks by the burn");
    expect(f.ledger.balanceOf(kEngine) == 0, "nothing left in custody");
    expect(f.engine.userForRequest(requestId) == std::optional<UserId>("alice"), "request maps to alice");
    expect(f.engine.pendingRequestOf("alice") == std::optional<RequestId>(requestId), "alice maps to request");
    expect(f.coordinator.pendingCount() == 1, "one randomness request queued");
    expect(f.events.size() == 1 && f.events[0].type == GachaEventType::RollStarted
        && f.events[0].requestId == requestId && f.events[0].user == "alice", "RollStarted emitted");
    expect(!f.events.empty() && std::string(gachaEventTypeName(f.events[0].type)) == "RollStarted", "event type name");

    Word256 word = 987654321;
    expect(f.coordinator.fulfillWith(requestId, {word}), "fulfilment accepted");

    expect(f.engine.stateOf("alice") == RollState::Idle, "alice back to Idle");
    expect(!f.engine.userForRequest(requestId), "request mapping deleted");
    expect(f.engine.pendingRollCount() == 0, "no outstanding rolls");

    auto beasts = f.collection.beastsOf("alice");
    expect(beasts.size() == 1, "exactly one beast minted");
    if (!beasts.empty()) {
        Bytes32 seed = BeastRoller::baseSeed(word, requestId);
        std::uint32_t rarityRoll = BeastRoller::deriveInRange(seed, BeastRoller::kRarityTag, kRarityRollMin, kRarityRollMax);
        std::uint32_t index = BeastRoller::deriveInRange(seed, BeastRoller::kBeastIndexTag, 0,
            static_cast<std::uint32_t>(f.catalog->size() - 1));
        const auto& attr = beasts[0].attributes;
        expect(attr.rarity == BeastRoller::rarityForRoll(rarityRoll), "minted rarity matches the derived roll");
        expect(attr.templateId == f.catalog->atIndex(index).templateId, "minted template matches the derived index");
        expect(attr.hp >= kHpMin && attr.hp <= kHpMax, "minted hp in bounds");
        expect(attr.attack >= kAttackMin && attr.attack <= kAttackMax, "minted attack in bounds");
        expect(attr.defense >= kDefenseMin && attr.defense <= kDefenseMax, "minted defense in bounds");
        expect(f.collection.templateOf(beasts[0].id) == std::optional<TemplateId>(attr.templateId), "registry reports template");
    }

    expect(f.events.size() == 2 && f.events[1].type == GachaEventType::RollFulfilled
        && f.events[1].itemId == std::optional<ItemId>(beasts.empty() ? 0 : beasts[0].id), "RollFulfilled emitted");

    // Idle로 돌아왔으니 다시 굴릴 수 있다
    RequestId second = f.engine.initiateRoll("alice");
    expect(second != requestId, "request ids are never reused");
}

void test_second_roll_is_rejected_without_ledger_change() {
    GachaFixture f;
    f.fund("alice", 30);
    f.engine.initiateRoll("alice");

    Amount balance = f.ledger.balanceOf("alice");
    Amount burned = f.ledger.totalBurned();
    expectGachaError(GachaErrorCode::RollNotIdle, [&] { f.engine.initiateRoll("alice"); }, "second roll while Rolling");
    try {
        f.engine.initiateRoll("alice");
    } catch (const GachaError& ex) {
        expect(ex.category() == GachaErrorCategory::StateConflict, "RollNotIdle is a StateConflict");
    }
    expect(f.ledger.balanceOf("alice") == balance, "rejected roll does not debit");
    expect(f.ledger.totalBurned() == burned, "rejected roll does not burn");
    expect(f.coordinator.pendingCount() == 1, "rejected roll does not request randomness");
}

void test_roll_failure_paths_are_atomic() {
    GachaFixture f;
    f.fund("poor", 9);
    expectGachaError(GachaErrorCode::InsufficientFunds, [&] { f.engine.initiateRoll("poor"); }, "roll without enough tokens");
    expect(f.ledger.balanceOf("poor") == tokens(9), "insufficient funds leaves balance");
    expect(f.engine.stateOf("poor") == RollState::Idle, "insufficient funds leaves state Idle");

    RefusingLedger refusing;
    GachaEngine stubborn(kEngine, refusing, f.coordinator, f.collection, f.catalog, tokens(10));
    expectGachaError(GachaErrorCode::TransferFailed, [&] { stubborn.initiateRoll("alice"); }, "ledger refuses the pull");
    expect(refusing.restores == 0, "nothing to restore when the pull failed");
    expect(stubborn.stateOf("alice") == RollState::Idle, "failed pull leaves state Idle");

    OfflineProvider offline;
    GachaEngine unlucky(kEngine, f.ledger, offline, f.collection, f.catalog, tokens(10));
    f.fund("alice", 10);
    Amount supply = f.ledger.totalSupply();
    expectGachaError(GachaErrorCode::RandomnessUnavailable, [&] { unlucky.initiateRoll("alice"); }, "provider refuses the request");
    expect(f.ledger.balanceOf("alice") == tokens(10), "pull restored after provider failure");
    expect(f.ledger.totalBurned() == 0, "burn restored after provider failure");
    expect(f.ledger.totalSupply() == supply, "supply restored after provider failure");
    expect(f.ledger.balanceOf(kEngine) == 0, "custody empty after provider failure");
    expect(unlucky.stateOf("alice") == RollState::Idle, "provider failure leaves state Idle");
}

void test_fulfilment_protocol_violations() {
    GachaFixture f;
    f.fund("alice", 10);
    RequestId requestId = f.engine.initiateRoll("alice");

    expectGachaError(GachaErrorCode::Unauthorized,
        [&] { f.engine.rawFulfillRandomWords("mallory", requestId, {Word256(1)}); }, "fulfilment from a stranger");
    expect(f.engine.stateOf("alice") == RollState::Rolling, "stranger cannot settle the roll");

    expectGachaError(GachaErrorCode::EmptyRandomness,
        [&] { f.engine.rawFulfillRandomWords(kCoordinator, requestId, {}); }, "fulfilment without words");
    expect(f.engine.userForRequest(requestId).has_value(), "empty fulfilment keeps the request");

    expect(!f.engine.rawFulfillRandomWords(kCoordinator, requestId + 100, {Word256(5)}), "unknown request ignored");
    expect(f.collection.totalMinted() == 0, "unknown request mints nothing");

    expect(f.coordinator.fulfill(requestId), "real fulfilment accepted");
    expect(!f.engine.rawFulfillRandomWords(kCoordinator, requestId, {Word256(5)}), "stale request ignored");
    expect(f.collection.totalMinted() == 1, "stale request mints nothing more");
    expectGachaError(GachaErrorCode::UnknownRequest, [&] { f.coordinator.fulfill(requestId); }, "coordinator delivers once");
}

void test_mint_reentry_sees_idle_state() {
    GachaFixture f;
    f.fund("alice", 20);
    RequestId first = f.engine.initiateRoll("alice");

    bool reentered = false;
    RollState stateDuringMint = RollState::Rolling;
    RequestId second = 0;
    f.collection.setMintHook([&](const MintedBeast& beast) {
        if (reentered || beast.owner != "alice") {
            return;
        }
        reentered = true;
        stateDuringMint = f.engine.stateOf("alice");
        second = f.engine.initiateRoll("alice");
    });

    expect(f.coordinator.fulfillWith(first, {Word256(42)}), "fulfilment with re-entrant mint");
    expect(reentered, "mint hook ran");
    expect(stateDuringMint == RollState::Idle, "state already Idle when the registry runs");
    expect(second != 0 && second != first, "re-entrant roll got a fresh request");
    expect(f.engine.stateOf("alice") == RollState::Rolling, "re-entrant roll is outstanding");
    expect(f.engine.pendingRequestOf("alice") == std::optional<RequestId>(second), "alice maps to the new request");
    expect(f.collection.balanceOf("alice") == 1, "first roll minted once");
    expect(f.ledger.balanceOf("alice") == 0, "both rolls paid");
}

void test_mint_failure_keeps_roll_pending() {
    GachaFixture f;
    FlakyRegistry registry(f.collection, 1);
    GachaEngine engine(kEngine, f.ledger, f.coordinator, registry, f.catalog, tokens(10));
    f.fund("alice", 10);

    RequestId requestId = engine.initiateRoll("alice");
    bool threw = false;
    try {
        f.coordinator.fulfillWith(requestId, {Word256(9)});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect(threw, "registry failure propagates");
    expect(registry.attempts == 1, "registry called once");
    expect(engine.stateOf("alice") == RollState::Rolling, "failed mint keeps the roll outstanding");
    expect(engine.userForRequest(requestId) == std::optional<UserId>("alice"), "failed mint keeps the mapping");
    expect(f.ledger.totalBurned() == tokens(10), "payment stays burned");
    expect(f.collection.totalMinted() == 0, "failed mint records nothing");
    expect(f.coordinator.pendingCount() == 1, "request goes back to the provider queue");

    // 레지스트리가 회복되면 같은 요청으로 다시 전달된다
    bool delivered = false;
    try {
        delivered = f.coordinator.fulfill(requestId);
    } catch (const std::exception& ex) {
        expect(false, std::string("re-delivery threw: ") + ex.what());
    }
    expect(delivered, "re-delivery accepted");
    expect(registry.attempts == 2, "registry retried once");
    expect(engine.stateOf("alice") == RollState::Idle, "re-delivery settles the roll");
    expect(!engine.userForRequest(requestId), "re-delivery clears the mapping");
    expect(f.collection.balanceOf("alice") == 1, "re-delivery mints exactly once");
    expect(f.coordinator.pendingCount() == 0, "nothing left queued");
}

void test_worker_retries_failed_delivery() {
    GachaFixture f;
    FlakyRegistry registry(f.collection, 1);
    GachaEngine engine(kEngine, f.ledger, f.coordinator, registry, f.catalog, tokens(10));
    f.fund("alice", 10);

    f.coordinator.start(std::chrono::milliseconds(0));
    engine.initiateRoll("alice");
    bool settled = waitFor([&] { return engine.stateOf("alice") == RollState::Idle; });
    f.coordinator.stop();

    expect(settled, "worker retried after the registry failure");
    expect(registry.attempts == 2, "one failure then one success");
    expect(f.collection.balanceOf("alice") == 1, "worker retry minted once");
}

void test_failing_mint_hook_keeps_fulfilment() {
    GachaFixture f;
    f.fund("alice", 10);
    RequestId requestId = f.engine.initiateRoll("alice");
    f.collection.setMintHook([](const MintedBeast&) { throw std::runtime_error("hook failed"); });

    bool accepted = false;
    try {
        accepted = f.coordinator.fulfillWith(requestId, {Word256(42)});
    } catch (const std::exception& ex) {
        expect(false, std::string("fulfilment threw: ") + ex.what());
    }
    expect(accepted, "fulfilment accepted despite the hook");
    expect(f.collection.balanceOf("alice") == 1, "exactly one beast minted");
    expect(f.engine.stateOf("alice") == RollState::Idle, "roll settled");
    expect(!f.engine.userForRequest(requestId), "mapping cleared");
    expect(f.coordinator.pendingCount() == 0, "request not queued again");
    expect(!f.events.empty() && f.events.back().type == GachaEventType::RollFulfilled, "RollFulfilled still emitted");
}

void test_throwing_listeners_do_not_undo_operations() {
    GachaFixture f;
    f.ledger.subscribe([](const GachaEvent&) { throw std::runtime_error("purchase listener"); });

    bool purchased = false;
    try {
        f.fund("alice", 10);
        purchased = true;
    } catch (const std::exception& ex) {
        expect(false, std::string("purchase threw: ") + ex.what());
    }
    expect(purchased && f.ledger.balanceOf("alice") == tokens(10), "purchase stands despite the listener");

    // 리스너는 엔진 락 밖에서 호출되므로 다른 스레드에서 엔진을 조회할 수 있다
    std::size_t seenFromOtherThread = 99;
    f.engine.subscribe([&](const GachaEvent& event) {
        if (event.type == GachaEventType::RollStarted) {
            std::thread reader([&] { seenFromOtherThread = f.engine.pendingRollCount(); });
            reader.join();
        }
        throw std::runtime_error("engine listener");
    });

    RequestId requestId = 0;
    try {
        requestId = f.engine.initiateRoll("alice");
    } catch (const std::exception& ex) {
        expect(false, std::string("initiateRoll threw: ") + ex.what());
    }
    expect(requestId != 0, "roll reported as started");
    expect(seenFromOtherThread == 1, "listener ran outside the engine lock");
    expect(f.engine.stateOf("alice") == RollState::Rolling, "roll outstanding");
    expect(f.ledger.totalBurned() == tokens(10), "payment burned once");

    bool delivered = false;
    try {
        delivered = f.coordinator.fulfillWith(requestId, {Word256(3)});
    } catch (const std::exception& ex) {
        expect(false, std::string("fulfilment threw: ") + ex.what());
    }
    expect(delivered, "fulfilment accepted despite the listener");
    expect(f.engine.stateOf("alice") == RollState::Idle, "roll settled");
    expect(f.collection.balanceOf("alice") == 1, "beast minted");
    expect(f.events.size() == 2, "other listeners still receive both events");
}

void test_rolling_user_without_funds_gets_state_conflict() {
    GachaFixture f;
    f.fund("alice", 10);
    f.engine.initiateRoll("alice");
    expect(f.ledger.balanceOf("alice") == 0, "whole balance spent on the roll");
    expectGachaError(GachaErrorCode::RollNotIdle, [&] { f.engine.initiateRoll("alice"); }, "broke user still Rolling");
}

void test_same_word_different_requests() {
    GachaFixture f;
    f.fund("alice", 10);
    f.fund("bob", 10);
    RequestId a = f.engine.initiateRoll("alice");
    RequestId b = f.engine.initiateRoll("bob");
    expect(a != b, "concurrent users get distinct requests");
    expect(f.engine.pendingRollCount() == 2, "two outstanding rolls");

    Word256 shared = 77777;
    f.coordinator.fulfillWith(a, {shared});
    f.coordinator.fulfillWith(b, {shared});

    auto alice = f.collection.beastsOf("alice");
    auto bob = f.collection.beastsOf("bob");
    expect(alice.size() == 1 && bob.size() == 1, "both rolls minted");
    if (alice.size() == 1 && bob.size() == 1) {
        const auto& x = alice[0].attributes;
        const auto& y = bob[0].attributes;
        expect(x.hp != y.hp || x.attack != y.attack || x.defense != y.defense, "same word yields independent stats");
    }
}

void test_background_delivery() {
    GachaFixture f;
    f.fund("alice", 10);
    f.coordinator.start(std::chrono::milliseconds(5));
    expect(f.coordinator.running(), "worker running");

    f.engine.initiateRoll("alice");
    for (int i = 0; i < 400 && f.engine.stateOf("alice") != RollState::Idle; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    f.coordinator.stop();

    expect(f.engine.stateOf("alice") == RollState::Idle, "worker delivered the randomness");
    expect(f.collection.balanceOf("alice") == 1, "worker delivery minted a beast");
    expect(!f.coordinator.running(), "worker stopped");
}

// ---------------------------------------------------------------------------
// Registry, config, logging

void test_collection_rules_and_persistence() {
    auto catalog = std::make_shared<const BeastCatalog>(BeastCatalog::defaultCatalog());
    BeastCollection collection(kEngine, catalog);

    MintedAttributes attr;
    attr.templateId = 2;
    attr.element = Element::Ice;
    attr.rarity = Rarity::Unique;
    attr.hp = 20000;
    attr.attack = 2000;
    attr.defense = 3000;

    expectGachaError(GachaErrorCode::Unauthorized, [&] { collection.mint("alice", "alice", attr); }, "only the engine mints");
    MintedAttributes unknown = attr;
    unknown.templateId = 99;
    expectGachaError(GachaErrorCode::OutOfBound, [&] { collection.mint(kEngine, "alice", unknown); }, "unknown template");

    ItemId first = collection.mint(kEngine, "alice", attr);
    ItemId second = collection.mint(kEngine, "bob", attr);
    expect(first == 1 && second == 2, "item ids start at 1 and increase");
    expect(collection.ownerOf(second) == std::optional<UserId>("bob"), "owner recorded");
    expect(!collection.templateOf(42).has_value(), "missing item has no template");

    nlohmann::json meta = collection.metadata(first);
    expect(meta.value<std::string>("rarity", "") == "Unique", "metadata rarity");
    expect(meta.value<std::string>("image", "") == "ipfs://etherbeast/2.png", "metadata image from catalog");

    fs::path dir = fs::temp_directory_path() / "etherbeast_tests";
    fs::path path = dir / "beasts.json";
    expect(RegistryPersistence::save(collection, path.string()), "registry saved");

    BeastCollection restored(kEngine, catalog);
    expect(RegistryPersistence::load(restored, path.string()), "registry loaded");
    expect(restored.totalMinted() == 2, "loaded both beasts");
    auto bobs = restored.beastsOf("bob");
    expect(bobs.size() == 1 && bobs[0].attributes.defense == 3000 && bobs[0].attributes.element == Element::Ice,
        "loaded beast keeps its attributes");
    expect(restored.mint(kEngine, "carol", attr) == 3, "ids continue after load");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

void test_config_parsing() {
    auto data = nlohmann::json::parse(R"({
        "rollPrice": "25",
        "priceFeed": {"mode": "http", "url": "http://127.0.0.1:9000/feed", "maxAgeSeconds": 300},
        "catalog": {"templateIds": [4, 8], "elements": ["Ice", "Fire"], "images": ["i", "f"]},
        "randomness": {"keyHash": "0xabc", "numWords": 2, "deliveryDelayMs": 250},
        "logPath": "logs/test.log",
        "verbose": true
    })");
    GachaConfig config = GachaConfig::fromJson(data);
    expect(config.rollPrice == tokens(25), "roll price parsed as whole tokens");
    expect(config.priceFeed.mode == PriceFeedMode::Http, "http feed selected");
    expect(config.priceFeed.maxAgeSeconds == 300, "max age parsed");
    expect(config.randomness.numWords == 2 && config.randomness.keyHash == "0xabc", "randomness params parsed");
    expect(config.deliveryDelayMs == 250, "delivery delay parsed");
    expect(config.logPath == "logs/test.log" && config.verbose, "log settings parsed");
    expect(config.buildCatalog()->templateIds() == std::vector<TemplateId>({4, 8}), "catalog seed applied");

    GachaConfig defaults = GachaConfig::fromJson(nlohmann::json::object());
    expect(defaults.rollPrice == tokens(10), "default roll price");
    expect(defaults.buildCatalog()->size() == 6, "default catalog");
    expect(defaults.buildPriceFeed(nullptr)->latestRound().answer == kEthUsd, "default static feed");

    expectGachaError(GachaErrorCode::InvalidConfig,
        [] { GachaConfig::fromJson(nlohmann::json::parse(R"({"priceFeed":{"mode":"carrier-pigeon"}})")); }, "unknown feed mode");
    expectGachaError(GachaErrorCode::InvalidConfig,
        [] { GachaConfig::fromJson(nlohmann::json::parse(R"({"randomness":{"numWords":0}})")); }, "zero words");
    expectGachaError(GachaErrorCode::InvalidConfig,
        [] { GachaConfig::fromJson(nlohmann::json::parse(R"({"rollPrice":"1.x"})")); }, "bad roll price");
    expectGachaError(GachaErrorCode::InvalidConfig,
        [] { GachaConfig::fromJson(nlohmann::json::parse(R"({"priceFeed":{"mode":"http"}})")); }, "http feed without url");
    expectGachaError(GachaErrorCode::InvalidConfig,
        [] { GachaConfig::fromJson(nlohmann::json::parse(R"({"priceFeed":{"decimals":-1}})")); }, "negative feed decimals");
}

void test_amount_helpers() {
    expect(parseUnits("1.5", kTokenDecimals) == Amount(1500000000000000000ULL), "1.5 tokens");
    expect(parseUnits("0.000000000000000001", kTokenDecimals) == Amount(1), "one base unit");
    expect(formatUnits(Amount(1500000000000000000ULL), kTokenDecimals) == "1.5", "format 1.5");
    expect(formatUnits(tokens(3), kTokenDecimals) == "3", "format whole tokens");
    expectGachaError(GachaErrorCode::InvalidConfig, [] { parseUnits("1.0000000000000000001", kTokenDecimals); }, "too many decimals");
    expectGachaError(GachaErrorCode::InvalidConfig, [] { parseUnits("-1", kTokenDecimals); }, "negative amount");

    Word256 value = 0x0102;
    Bytes32 bytes = toBigEndian(value);
    expect(bytes[30] == 0x01 && bytes[31] == 0x02, "big-endian layout");
    expect(fromBigEndian(bytes) == value, "big-endian decode");
}

void test_logger_writes_lines() {
    fs::path dir = fs::temp_directory_path() / "etherbeast_log_test";
    fs::path path = dir / "nested" / "gacha.log";
    std::error_code ec;
    fs::remove_all(dir, ec);

    {
        auto logger = std::make_shared<Logger>(path.string());
        GachaFixture f;
        SummonTokenLedger ledger(kOwner, kEngine, f.pricing, logger);
        RecordingRefunds refunds;
        ledger.purchase("alice", f.pricing->quote(tokenUnit()), tokenUnit(), refunds);
        logTo(logger, LogLevel::Warning, "manual warning");
        logTo(nullptr, LogLevel::Error, "dropped");
    }

    std::ifstream file(path);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    expect(content.find("[INFO]") != std::string::npos, "purchase logged at INFO");
    expect(content.find("[WARN] manual warning") != std::string::npos, "warning logged");

    fs::remove_all(dir, ec);
}

void test_unwritable_log_path_is_silent() {
    fs::path dir = fs::temp_directory_path() / "etherbeast_blocked_test";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    fs::path blocker = dir / "blocker";
    std::ofstream(blocker) << "not a directory";

    // 부모 경로가 일반 파일이라 디렉터리를 만들 수 없다
    fs::path logPath = blocker / "logs" / "gacha.log";
    try {
        Logger logger(logPath.string());
        logger.info("dropped");
        logger.error("dropped too");
    } catch (const std::exception& ex) {
        expect(false, std::string("unwritable log path threw: ") + ex.what());
    }
    expect(!fs::exists(logPath, ec), "nothing written under the blocked path");

    auto catalog = std::make_shared<const BeastCatalog>(BeastCatalog::defaultCatalog());
    BeastCollection collection(kEngine, catalog);
    bool saved = true;
    try {
        saved = RegistryPersistence::save(collection, (blocker / "save" / "beasts.json").string());
    } catch (const std::exception& ex) {
        expect(false, std::string("blocked save threw: ") + ex.what());
    }
    expect(!saved, "blocked save reports failure");

    fs::remove_all(dir, ec);
}

} // namespace

int main() {
    std::cout << "Running EtherBeast tests...\n";

    test_quote_matches_oracle_rate();
    test_quote_rejects_bad_input();
    test_quote_staleness_and_decimals();
    test_http_feed_parsing();

    test_purchase_exact_and_overpaid();
    test_purchase_failures_leave_no_trace();
    test_treasury_and_transfers();

    test_catalog_validation();
    test_catalog_from_json();

    test_rarity_thresholds();
    test_derivation_is_bounded_and_deterministic();
    test_rarity_distribution_converges();

    test_roll_lifecycle();
    test_second_roll_is_rejected_without_ledger_change();
    test_roll_failure_paths_are_atomic();
    test_fulfilment_protocol_violations();
    test_mint_reentry_sees_idle_state();
    test_mint_failure_keeps_roll_pending();
    test_worker_retries_failed_delivery();
    test_failing_mint_hook_keeps_fulfilment();
    test_throwing_listeners_do_not_undo_operations();
    test_rolling_user_without_funds_gets_state_conflict();
    test_same_word_different_requests();
    test_background_delivery();

    test_collection_rules_and_persistence();
    test_config_parsing();
    test_amount_helpers();
    test_logger_writes_lines();
    test_unwritable_log_path_is_silent();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}

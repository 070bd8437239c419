#include <chrono>
#include <iostream>
#include <limits>
#include <memory>
#include <string>

#include "BeastCollection.h"
#include "GachaConfig.h"
#include "GachaEngine.h"
#include "GachaError.h"
#include "LocalRandomnessCoordinator.h"
#include "Logger.h"
#include "PricingOracleAdapter.h"
#include "RegistryPersistence.h"
#include "SummonTokenLedger.h"

namespace {

const UserId kPlayer = "player";
const UserId kEngineId = "etherbeast-gacha";
const UserId kCoordinatorId = "local-vrf-coordinator";
const UserId kOwnerId = "etherbeast-owner";

// 콘솔 플레이어의 결제 자산 지갑. 환불은 여기로 들어온다.
class ConsoleWallet : public RefundChannel {
public:
    bool sendRefund(const UserId& to, const Amount& amount) override {
        if (to != kPlayer) {
            return false;
        }
        balance += amount;
        return true;
    }

    Amount balance{pow10(kTokenDecimals)};
};

void printMenu() {
    std::cout << "\n===== EtherBeast 소환 =====\n";
    std::cout << "1. 토큰 구매\n";
    std::cout << "2. 비스트 소환\n";
    std::cout << "3. 대기 중인 난수 전달\n";
    std::cout << "4. 보유 비스트 보기\n";
    std::cout << "5. 잔액 / 상태\n";
    std::cout << "0. 종료\n";
    std::cout << "선택: ";
}

void showBeast(const MintedBeast& beast) {
    const auto& attr = beast.attributes;
    std::cout << "#" << beast.id << " | " << rarityToString(attr.rarity) << " " << rarityName(attr.rarity)
              << " | 템플릿 " << attr.templateId << " (" << elementToString(attr.element) << ")"
              << " | HP: " << attr.hp << " | ATK: " << attr.attack << " | DEF: " << attr.defense << "\n";
}

std::string promptLine(const std::string& message) {
    std::cout << message;
    std::string line;
    std::getline(std::cin, line);
    return line;
}

void buyTokens(SummonTokenLedger& ledger, const PricingOracleAdapter& pricing, ConsoleWallet& wallet) {
    Amount amount = parseUnits(promptLine("구매할 토큰 수량: "), kTokenDecimals);
    Amount required = pricing.quote(amount);
    std::cout << "필요 금액: " << formatUnits(required, kTokenDecimals) << " ETH (지갑: "
              << formatUnits(wallet.balance, kTokenDecimals) << " ETH)\n";

    std::string paymentText = promptLine("지불할 금액(ETH, 엔터 시 필요 금액): ");
    Amount payment = paymentText.empty() ? required : parseUnits(paymentText, kTokenDecimals);
    if (payment > wallet.balance) {
        std::cout << "지갑 잔액이 부족합니다.\n";
        return;
    }

    wallet.balance -= payment;
    try {
        PurchaseReceipt receipt = ledger.purchase(kPlayer, payment, amount, wallet);
        std::cout << formatUnits(receipt.tokens, kTokenDecimals) << " 토큰을 구매했습니다.";
        if (receipt.refunded > 0) {
            std::cout << " 잔돈 " << formatUnits(receipt.refunded, kTokenDecimals) << " ETH 환불.";
        }
        std::cout << "\n";
    } catch (const GachaError&) {
        // 구매가 취소되면 지불한 금액은 그대로 돌아온다
        wallet.balance += payment;
        throw;
    }
}

void showStatus(const SummonTokenLedger& ledger, const GachaEngine& engine, const ConsoleWallet& wallet,
    const LocalRandomnessCoordinator& coordinator) {
    std::cout << "지갑: " << formatUnits(wallet.balance, kTokenDecimals) << " ETH\n";
    std::cout << "토큰: " << formatUnits(ledger.balanceOf(kPlayer), kTokenDecimals)
              << " (소환 1회 " << formatUnits(engine.rollPrice(), kTokenDecimals) << ")\n";
    std::cout << "소환 상태: " << rollStateName(engine.stateOf(kPlayer));
    if (auto requestId = engine.pendingRequestOf(kPlayer)) {
        std::cout << " (request " << *requestId << ")";
    }
    std::cout << "\n";
    std::cout << "대기 중인 난수 요청: " << coordinator.pendingCount() << "\n";
    std::cout << "총 발행량: " << formatUnits(ledger.totalSupply(), kTokenDecimals)
              << ", 소각량: " << formatUnits(ledger.totalBurned(), kTokenDecimals) << "\n";
}

} // 익명 네임스페이스 종료

int main() {
    GachaConfig config;
    try {
        config = GachaConfig::fromEnvironment();
    } catch (const GachaError& ex) {
        std::cerr << "설정을 불러오지 못했습니다: " << ex.what() << "\n";
        return 1;
    }

    auto logger = std::make_shared<Logger>(config.logPath, config.verbose);
    std::shared_ptr<const BeastCatalog> catalog;
    try {
        catalog = config.buildCatalog();
    } catch (const GachaError& ex) {
        std::cerr << "카탈로그가 올바르지 않습니다: " << ex.what() << "\n";
        return 1;
    }

    auto feed = config.buildPriceFeed(logger);
    auto pricing = std::make_shared<PricingOracleAdapter>(feed, config.priceFeed.maxAgeSeconds);
    SummonTokenLedger ledger(kOwnerId, kEngineId, pricing, logger);
    LocalRandomnessCoordinator coordinator(kCoordinatorId, logger);
    BeastCollection collection(kEngineId, catalog, logger);
    if (RegistryPersistence::load(collection, config.savePath)) {
        logger->info("저장된 비스트 " + std::to_string(collection.totalMinted()) + "마리를 불러왔습니다: " + config.savePath);
    }

    GachaEngine engine(kEngineId, ledger, coordinator, collection, catalog, config.rollPrice, config.randomness, logger);
    engine.subscribe([&collection](const GachaEvent& event) {
        if (event.type == GachaEventType::RollFulfilled && event.itemId) {
            if (auto beast = collection.find(*event.itemId)) {
                std::cout << "\n새로운 비스트 등장!\n";
                showBeast(*beast);
            }
        }
    });

    if (config.deliveryDelayMs > 0) {
        coordinator.start(std::chrono::milliseconds(config.deliveryDelayMs));
    }

    ConsoleWallet wallet;
    bool running = true;
    while (running) {
        printMenu();
        int choice = -1;
        if (!(std::cin >> choice)) {
            if (std::cin.eof()) {
                break;
            }
            std::cin.clear();
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            continue;
        }
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');

        try {
            switch (choice) {
                case 1:
                    buyTokens(ledger, *pricing, wallet);
                    break;
                case 2: {
                    RequestId requestId = engine.initiateRoll(kPlayer);
                    std::cout << "소환 의식 시작! (request " << requestId << ")\n";
                    if (!coordinator.running()) {
                        std::cout << "3번 메뉴로 난수를 전달하면 결과가 나옵니다.\n";
                    }
                    break;
                }
                case 3: {
                    std::size_t delivered = coordinator.fulfillAll();
                    std::cout << delivered << "건의 난수를 전달했습니다.\n";
                    break;
                }
                case 4: {
                    auto beasts = collection.beastsOf(kPlayer);
                    if (beasts.empty()) {
                        std::cout << "보유한 비스트가 없습니다.\n";
                    }
                    for (const auto& beast : beasts) {
                        showBeast(beast);
                    }
                    break;
                }
                case 5:
                    showStatus(ledger, engine, wallet, coordinator);
                    break;
                case 0:
                    running = false;
                    break;
                default:
                    std::cout << "올바른 메뉴를 선택하세요.\n";
                    break;
            }
        } catch (const GachaError& ex) {
            std::cout << "실패: " << ex.what() << " [" << gachaErrorCategoryName(ex.category()) << "]\n";
        }
    }

    coordinator.stop();
    if (!RegistryPersistence::save(collection, config.savePath)) {
        logger->error("비스트 저장 실패: " + config.savePath);
    }
    std::cout << "게임을 종료합니다.\n";
    return 0;
}

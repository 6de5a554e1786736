// NFT AMM - Basic Usage Example
//
// Loads a factory configuration, whitelists a linear curve, and opens a
// native-asset NFT pool seeded with two NFTs.
//
//   nftamm_basic [config.json]

#include <nftamm/logger.hpp>
#include <nftamm/memory_assets.hpp>
#include <nftamm/pair_factory.hpp>

#include <exception>
#include <iostream>

using namespace nftamm;

namespace {

class PrintingListener : public NullFactoryListener {
public:
    void on_new_pair(const NewPairEvent& event) override {
        std::cout << "[NewPair] " << to_hex(event.pair) << " collection "
                  << to_hex(event.nft) << " (" << to_string(event.variant) << ")\n";
    }

    void on_nft_deposit(const Address& pair) override {
        std::cout << "[NFTDeposit] " << to_hex(pair) << "\n";
    }
};

void print_pair(const Pair& pair) {
    std::cout << "\n=== Pair " << to_hex(pair.address()) << " ===\n"
              << "  variant:    " << to_string(pair.variant()) << "\n"
              << "  pool type:  " << to_string(pair.pool_type()) << "\n"
              << "  curve:      " << pair.curve().name() << "\n"
              << "  owner:      " << to_hex(pair.owner()) << "\n"
              << "  spot price: " << x18::to_string(pair.spot_price()) << "\n"
              << "  delta:      " << x18::to_string(pair.delta()) << "\n"
              << "  balance:    " << x18::to_string(pair.fungible_balance()) << "\n"
              << "  NFTs:      ";
    for (uint64_t id : pair.held_nft_ids()) {
        std::cout << " " << id;
    }
    std::cout << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    const char* path = argc > 1 ? argv[1] : "examples/factory.json";

    FactoryConfig config;
    try {
        config = FactoryConfig::from_file(path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load " << path << ": " << e.what() << "\n";
        return 1;
    }

    init_logger(parse_log_level(config.log_level).value_or(LogLevel::info));

    MemoryNativeLedger native;
    ReceiverRegistry receivers;
    PairFactory factory(config, native, receivers);

    PrintingListener listener;
    factory.set_listener(&listener);

    int32_t status = factory.apply_access_lists(config.owner, config);
    if (status != errors::OK) {
        std::cerr << "Access lists rejected: " << error_name(status) << "\n";
        return 1;
    }

    LinearCurve curve(addresses::from_u64(0xc0));
    status = factory.set_bonding_curve_allowed(config.owner, curve, true);
    if (status != errors::OK) {
        std::cerr << "Curve whitelist failed: " << error_name(status) << "\n";
        return 1;
    }

    // A trader holding two NFTs of an enumerable collection plus some native value
    const Address trader = addresses::from_u64(0x7a);
    MemoryNftCollection collection(addresses::from_u64(0x4e), true, &receivers);
    for (uint64_t id : {1, 2}) {
        if (collection.mint(trader, id) != errors::OK) {
            std::cerr << "Mint of NFT " << id << " failed\n";
            return 1;
        }
    }
    collection.set_approval_for_all(trader, factory.address(), true);
    native.mint(trader, 1000);

    CreatePairParams params{};
    params.asset_kind = AssetKind::NATIVE;
    params.nft = &collection;
    params.curve = &curve;
    params.token = nullptr;
    params.asset_recipient = ZERO_ADDRESS;
    params.pool_type = PoolType::NFT;
    params.delta = 10;
    params.fee = 0;
    params.spot_price = 100;
    params.initial_nft_ids = {1, 2};
    params.initial_amount = 5;

    CreatePairResult result = factory.create_pair(trader, params);
    if (result.status != errors::OK) {
        std::cerr << "create_pair failed: " << error_name(result.status) << "\n";
        return 1;
    }

    print_pair(*factory.pair(result.pair));

    const BuyQuote quote = curve.get_buy_info(100, 10, 2, 0, factory.fees().multiplier());
    std::cout << "\nBuying 2 NFTs costs " << x18::to_string(quote.input_value)
              << " (protocol fee " << x18::to_string(quote.protocol_fee) << ")\n";

    auto stats = factory.get_stats();
    std::cout << "\nPairs created: " << stats.pairs_created
              << ", rejected: " << stats.pairs_rejected << "\n";
    return 0;
}

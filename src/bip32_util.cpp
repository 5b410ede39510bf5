#include "bip32_util.hpp"
#include "hash_utils.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <memory>
#include <sstream>
#include <algorithm>
#include <string_view>

namespace bitcli {

namespace {

using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using BnCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using EcGroupPtr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using EcPointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

[[noreturn]] void derivation_error(const char* what) {
    throw WalletError(WalletError::ErrorType::KeyDerivationError, what);
}

// The secp256k1 group order n
BignumPtr curve_order() {
    EcGroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1), EC_GROUP_free);
    BignumPtr n(BN_new(), BN_free);
    if (!group || !n || !EC_GROUP_get_order(group.get(), n.get(), nullptr)) {
        derivation_error("Failed to load secp256k1 group order");
    }
    return n;
}

} // namespace

// A private key is any integer in [1, n-1]. Keys of the wrong length, zero,
// or at or above the group order cannot be used for signing.
bool Bip32Util::is_valid_private_key(std::span<const uint8_t> key) {
    if (key.size() != 32) {
        return false;
    }
    BignumPtr k(BN_bin2bn(key.data(), static_cast<int>(key.size()), nullptr), BN_free);
    if (!k || BN_is_zero(k.get())) {
        return false;
    }
    auto n = curve_order();
    return BN_cmp(k.get(), n.get()) < 0;
}

// pub = priv * G on secp256k1, serialized compressed: 0x02 or 0x03 (parity
// of y) followed by the 32-byte x coordinate
std::vector<uint8_t> Bip32Util::derive_public_key_from_private(std::span<const uint8_t> key) {
    if (!is_valid_private_key(key)) {
        derivation_error("Private key is out of range");
    }

    EcGroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1), EC_GROUP_free);
    BignumPtr priv_key(BN_bin2bn(key.data(), static_cast<int>(key.size()), nullptr), BN_free);
    if (!group || !priv_key) {
        derivation_error("Failed to load private key");
    }

    // pub = priv * G
    EcPointPtr pub_key(EC_POINT_new(group.get()), EC_POINT_free);
    if (!pub_key || !EC_POINT_mul(group.get(), pub_key.get(), priv_key.get(), nullptr, nullptr, nullptr)) {
        derivation_error("Failed to compute public key");
    }

    std::vector<uint8_t> result(33);
    size_t size = EC_POINT_point2oct(
        group.get(), pub_key.get(), POINT_CONVERSION_COMPRESSED,
        result.data(), result.size(), nullptr
    );
    if (size != 33) {
        derivation_error("Failed to serialize public key");
    }

    return result;
}

// Creates the master extended key from a seed as defined in BIP32
// https://github.com/bitcoin/bips/blob/master/bip-0032.mediawiki#master-key-generation
//
// I = HMAC-SHA512(Key = "Bitcoin seed", Data = seed)
// The left 32 bytes are the master private key, the right 32 bytes the chain code.
ExKey Bip32Util::master_from_seed(std::span<const uint8_t> seed) {
    static constexpr std::string_view kSeedKey = "Bitcoin seed";
    auto i = HashUtils::hmac_sha512(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(kSeedKey.data()), kSeedKey.size()),
        seed);

    ExKey master;
    std::copy_n(i.begin(), 32, master.key.begin());
    std::copy_n(i.begin() + 32, 32, master.chaincode.begin());

    if (!is_valid_private_key(master.key)) {
        derivation_error("Seed produced an invalid master key");
    }
    return master;
}

// CKDpriv from BIP32
// https://github.com/bitcoin/bips/blob/master/bip-0032.mediawiki#private-parent-key--private-child-key
//
// I = HMAC-SHA512(parent chain code, data || ser32(i))
// child key = parse256(I_L) + parent key (mod n), child chain code = I_R.
//
// Hardened derivation (child_num >= 0x80000000) commits to the parent private key,
// normal derivation to the parent public key.
ExKey Bip32Util::derive_priv_child(const ExKey& parent, uint32_t child_num) {
    std::vector<uint8_t> data;
    data.reserve(37);

    if (child_num >= HARDENED) {
        // data = 0x00 || parent private key
        data.push_back(0x00);
        data.insert(data.end(), parent.key.begin(), parent.key.end());
    } else {
        // data = parent compressed public key
        auto pubkey = derive_public_key_from_private(parent.key);
        data.insert(data.end(), pubkey.begin(), pubkey.end());
    }

    // Child number in big-endian format
    data.push_back(static_cast<uint8_t>((child_num >> 24) & 0xff));
    data.push_back(static_cast<uint8_t>((child_num >> 16) & 0xff));
    data.push_back(static_cast<uint8_t>((child_num >> 8) & 0xff));
    data.push_back(static_cast<uint8_t>(child_num & 0xff));

    auto hmac_result = HashUtils::hmac_sha512(parent.chaincode, data);

    ExKey child;
    child.depth = static_cast<uint8_t>(parent.depth + 1);
    child.child_number = child_num;
    std::copy_n(hmac_result.begin() + 32, 32, child.chaincode.begin());

    // child_key = (parent_key + IL) mod n
    auto n = curve_order();
    BignumPtr il(BN_bin2bn(hmac_result.data(), 32, nullptr), BN_free);
    BignumPtr parent_key(BN_bin2bn(parent.key.data(), 32, nullptr), BN_free);
    BignumPtr child_key(BN_new(), BN_free);
    BnCtxPtr ctx(BN_CTX_new(), BN_CTX_free);

    if (!il || !parent_key || !child_key || !ctx) {
        derivation_error("Out of memory during child derivation");
    }
    // IL >= n makes this index invalid; BIP32 says to move on to the next index
    if (BN_cmp(il.get(), n.get()) >= 0 ||
        !BN_mod_add(child_key.get(), parent_key.get(), il.get(), n.get(), ctx.get()) ||
        BN_is_zero(child_key.get())) {
        derivation_error("Child derivation produced an invalid key");
    }

    // Left-pad to 32 bytes; the sum may have leading zero bytes
    if (BN_bn2binpad(child_key.get(), child.key.data(), 32) != 32) {
        derivation_error("Failed to serialize child key");
    }

    return child;
}

// Walks a path such as "m/84'/0'/0'/0/0"; a trailing ' or h marks a
// hardened index. Anything else in a component is a KeyDerivationError.
ExKey Bip32Util::get_child_key_at_path(const ExKey& key, const std::string& derivation_path) {
    std::string path = derivation_path;
    if (path == "m") {
        return key;
    }
    if (path.starts_with("m/")) {
        path = path.substr(2);
    }

    ExKey current_key = key;
    std::istringstream path_stream(path);
    std::string index_str;

    while (std::getline(path_stream, index_str, '/')) {
        bool hardened = index_str.ends_with('\'') || index_str.ends_with('h');
        if (hardened) {
            index_str.pop_back();
        }
        if (index_str.empty() ||
            !std::all_of(index_str.begin(), index_str.end(), [](char c) { return c >= '0' && c <= '9'; })) {
            derivation_error("Invalid derivation path");
        }

        unsigned long index = 0;
        try {
            index = std::stoul(index_str);
        } catch (const std::out_of_range&) {
            derivation_error("Derivation index out of range");
        }
        if (index >= HARDENED) {
            derivation_error("Derivation index out of range");
        }

        current_key = derive_priv_child(current_key, static_cast<uint32_t>(index) + (hardened ? HARDENED : 0));
    }

    return current_key;
}

} // namespace bitcli

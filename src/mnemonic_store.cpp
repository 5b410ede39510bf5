#include "mnemonic_store.hpp"
#include "error.hpp"
#include <fstream>
#include <sstream>
#include <system_error>

namespace bitcli {

namespace fs = std::filesystem;

namespace {

[[noreturn]] void storage_error(const std::string& what) {
    throw WalletError(WalletError::ErrorType::StorageError, what);
}

} // namespace

FileMnemonicStore::FileMnemonicStore(fs::path directory)
    : directory_(std::move(directory))
{}

std::string FileMnemonicStore::load() const {
    const auto path = file_path();
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            storage_error("Failed to access " + path.string() + ": " + ec.message());
        }
        return "";
    }

    std::ifstream file(path);
    if (!file) {
        storage_error("Failed to open " + path.string() + " for reading");
    }
    std::stringstream contents;
    contents << file.rdbuf();

    std::string mnemonic = contents.str();
    while (!mnemonic.empty() && (mnemonic.back() == '\n' || mnemonic.back() == '\r' || mnemonic.back() == ' ')) {
        mnemonic.pop_back();
    }
    return mnemonic;
}

// The file holds the wallet secret, so it is readable by the owner only
void FileMnemonicStore::save(const std::string& mnemonic) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        storage_error("Failed to create " + directory_.string() + ": " + ec.message());
    }

    const auto path = file_path();
    {
        std::ofstream file(path, std::ios::trunc);
        if (!file) {
            storage_error("Failed to open " + path.string() + " for writing");
        }
        file << mnemonic;
        if (!file.flush()) {
            storage_error("Failed to write " + path.string());
        }
    }

    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec) {
        storage_error("Failed to restrict permissions of " + path.string() + ": " + ec.message());
    }
}

void FileMnemonicStore::reset() {
    std::error_code ec;
    fs::remove_all(directory_, ec);
    if (ec) {
        storage_error("Failed to remove " + directory_.string() + ": " + ec.message());
    }
}

} // namespace bitcli

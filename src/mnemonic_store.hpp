#pragma once

#include <filesystem>
#include <string>

namespace bitcli {

// Where the wallet's mnemonic phrase is kept between runs
class MnemonicStore {
public:
    virtual ~MnemonicStore() = default;

    // The stored phrase, or an empty string if none is stored
    virtual std::string load() const = 0;
    virtual void save(const std::string& mnemonic) = 0;
    // Forgets the stored phrase
    virtual void reset() = 0;
};

// Plain text file "mnemonic.txt" inside a directory owned by the wallet.
// Failures throw WalletError(StorageError).
class FileMnemonicStore : public MnemonicStore {
public:
    static constexpr const char* FILE_NAME = "mnemonic.txt";

    explicit FileMnemonicStore(std::filesystem::path directory);

    std::string load() const override;
    void save(const std::string& mnemonic) override;
    // Removes the whole directory
    void reset() override;

    std::filesystem::path file_path() const { return directory_ / FILE_NAME; }

private:
    std::filesystem::path directory_;
};

} // namespace bitcli

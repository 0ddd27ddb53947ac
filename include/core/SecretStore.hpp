// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler
// Secret Store: one named opaque credential

#ifndef SECRET_STORE_HPP
#define SECRET_STORE_HPP

#include <optional>
#include <stdexcept>
#include <string>

namespace BerryUtils { class ILogger; }

namespace Berry::Core {

    class SecretStoreError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Secret Store határfelület. A titok átlátszatlan string, nem titkosítjuk.
     */
    class ISecretStore {
    public:
        virtual ~ISecretStore() = default;

        // std::nullopt, ha nincs beállítva
        virtual std::optional<std::string> get() = 0;
        virtual void set(const std::string& value) = 0;
        virtual void clear() = 0;
    };

    /**
     * @brief 0600-as fájl a state könyvtárban.
     * Olvasás csak akkor, ha a tulajdonos az effektív user és nincs group/other jog.
     * @throws SecretStoreError I/O vagy jogosultsági hiba esetén
     */
    class FileSecretStore : public ISecretStore {
    public:
        explicit FileSecretStore(std::string path);

        std::optional<std::string> get() override;
        void set(const std::string& value) override;
        void clear() override;

        const std::string& getPath() const { return path; }

    private:
        std::string path;
    };

    /**
     * @brief A tárolt titok, trimmelve. Üres vagy olvashatatlan titok: std::nullopt.
     * Tárolási hibát naplóz, nem dob.
     */
    std::optional<std::string> resolveSecret(ISecretStore& store, BerryUtils::ILogger& log);

    // sodium_memzero a string teljes pufferén, majd ürítés.
    void wipeSecret(std::string& value);

    // <state dir>/secret
    std::string defaultSecretPath();
}

#endif

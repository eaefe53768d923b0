#pragma once

#include "core/services/IHttpClient.hpp"
#include "core/types/PollTypes.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace fleetwatch::infra {

/**
 * @brief Firmware generation of an Iconbit player, learned from its answers.
 */
enum class IconbitFirmware {
    Old, ///< Serves /status.xml
    New  ///< Serves /now, 404 on /status.xml
};

/**
 * @brief HTTP control client for Iconbit media players.
 *
 * Status reads remember per address which firmware answered so later polls
 * ask the right page first. The hint cache is shared by all threads.
 */
class IconbitClient {
public:
    static constexpr uint16_t kPort = 8081;
    static constexpr std::chrono::milliseconds kTimeout{8000};
    static constexpr std::chrono::milliseconds kUploadTimeout{60000};

    explicit IconbitClient(std::shared_ptr<core::IHttpClient> http);

    /**
     * @brief File list, free space and playback state.
     *
     * Returns an empty status when the main page does not answer at all.
     */
    core::MediaPlayerStatus status(const std::string& address);

    bool play(const std::string& address);
    bool stop(const std::string& address);

    /**
     * @brief Plays one file; old firmware takes /play?file=, new firmware /playlink?link=.
     */
    bool playFile(const std::string& address, const std::string& fileName);

    bool deleteFile(const std::string& address, const std::string& fileName);

    /**
     * @brief Uploads as multipart/form-data to / and, if refused, to /upload.
     */
    bool upload(const std::string& address, const std::string& fileName, const std::string& content);

    /**
     * @brief Deletes every listed file. True only if every delete was accepted.
     */
    bool deleteAll(const std::string& address);

    std::optional<IconbitFirmware> firmwareHint(const std::string& address) const;

private:
    core::HttpResponse get(const std::string& address, const std::string& target);
    core::HttpResponse postFile(const std::string& address, const std::string& target,
                                const std::string& fileName, const std::string& content);
    void rememberFirmware(const std::string& address, IconbitFirmware firmware);

    /// Both return true once @p status is final.
    bool readStatusXml(const std::string& address, core::MediaPlayerStatus& status);
    bool readNowPage(const std::string& address, core::MediaPlayerStatus& status);

    std::shared_ptr<core::IHttpClient> http_;
    mutable std::mutex hintsMutex_;
    std::map<std::string, IconbitFirmware> hints_;
};

} // namespace fleetwatch::infra

#pragma once

#include "export.h"
#include <string>
#include <vector>

namespace uldas {

/**
 * @brief Commits track metadata changes to a media file
 */
class ULDAS_API MetadataWriter {
public:
    virtual ~MetadataWriter() = default;

    /**
     * @brief Set the language tag of an audio track
     * @param audio_index 0-based index among audio tracks
     * @return True if successful
     */
    virtual bool set_audio_language(const std::string& file_path,
                                    int audio_index,
                                    const std::string& language_code) = 0;

    /**
     * @brief Set language, display name and forced flag of a subtitle track
     * @param subtitle_index 0-based index among subtitle tracks
     * @return True if successful
     */
    virtual bool set_subtitle_metadata(const std::string& file_path,
                                       int subtitle_index,
                                       const std::string& language_code,
                                       bool forced,
                                       bool sdh) = 0;

    virtual std::string get_last_error() const = 0;
};

/**
 * @brief Display name for a subtitle track: "French", "French [Forced] [SDH]"
 */
ULDAS_API std::string subtitle_track_name(const std::string& language_code, bool forced, bool sdh);

/**
 * @brief MetadataWriter that runs mkvpropedit (MKVToolNix) in place
 */
class ULDAS_API MkvPropEditWriter : public MetadataWriter {
public:
    /**
     * @param executable mkvpropedit binary (name resolved through PATH, or a path)
     * @param dry_run Report the change instead of running the tool
     */
    explicit MkvPropEditWriter(std::string executable = "mkvpropedit", bool dry_run = false);

    bool set_audio_language(const std::string& file_path,
                            int audio_index,
                            const std::string& language_code) override;

    bool set_subtitle_metadata(const std::string& file_path,
                               int subtitle_index,
                               const std::string& language_code,
                               bool forced,
                               bool sdh) override;

    std::string get_last_error() const override { return last_error_; }

    /**
     * @brief Whether the executable can be found
     */
    bool is_available() const;

    /**
     * @brief Argument lists (without the executable) for each operation
     */
    static std::vector<std::string> audio_language_args(const std::string& file_path,
                                                        int audio_index,
                                                        const std::string& language_code);
    static std::vector<std::string> subtitle_metadata_args(const std::string& file_path,
                                                           int subtitle_index,
                                                           const std::string& language_code,
                                                           bool forced,
                                                           bool sdh);

private:
    // Run the tool and wait; false on spawn failure or non-zero exit
    bool run(const std::vector<std::string>& args);

    std::string executable_;
    bool dry_run_;
    std::string last_error_;
};

} // namespace uldas

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/contracts/IExperienceWriter.h"
#include "experience/ExperienceRecord.h"

namespace edgebook {
namespace experience {

struct ExperienceWriterConfig {
    std::filesystem::path output_dir = "data/experiences";
    bool partition_by_date = true;
    std::string filename_prefix = "experiences";
};

// Fixed column order of the experience table; context columns sit between
// won_flag and context_hash.
std::vector<std::string> experienceColumns(const std::vector<ExperienceRecord>& records);

// Writes a columnar JSON document (.columnar.json). When that fails for any
// reason the partial file is removed and a gzip CSV (.csv.gz) is written instead.
class ExperienceWriter : public core::IExperienceWriter {
public:
    explicit ExperienceWriter(ExperienceWriterConfig config = {});

    std::filesystem::path write(const std::vector<ExperienceRecord>& records,
                                const std::string& label) override;

    const ExperienceWriterConfig& config() const { return config_; }

    static void writeColumnar(const std::vector<ExperienceRecord>& records,
                              const std::filesystem::path& path);
    static void writeCsvGz(const std::vector<ExperienceRecord>& records,
                           const std::filesystem::path& path);

private:
    std::string baseName(const std::vector<ExperienceRecord>& records, const std::string& label) const;

    ExperienceWriterConfig config_;
};

class ExperienceReader {
public:
    // Reads either format written by ExperienceWriter; throws PersistenceError
    // for unreadable or unrecognised files.
    static std::vector<ExperienceRecord> read(const std::filesystem::path& path);

    static std::vector<ExperienceRecord> readColumnar(const std::filesystem::path& path);
    static std::vector<ExperienceRecord> readCsvGz(const std::filesystem::path& path);
};

} // namespace experience
} // namespace edgebook

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "experience/ExperienceRecord.h"

namespace edgebook {
namespace core {

class IExperienceWriter {
public:
    virtual ~IExperienceWriter() = default;

    // Persists one run's experience table and returns the file written.
    virtual std::filesystem::path write(const std::vector<experience::ExperienceRecord>& records,
                                        const std::string& label) = 0;
};

} // namespace core
} // namespace edgebook

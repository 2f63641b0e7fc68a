#pragma once

#include <cstddef>
#include "copy_strategy.hpp"
#include "../../adapters/fs.hpp"

namespace dircopy::core {

/// Копирование файлов через sendfile(2) без буферов в user space.
/// Если sendfile отказывает на конкретном файле, этот файл докопируется
/// буферизованным циклом; остальной вызов продолжается.
class SendfileStrategy final : public CopyStrategy {
public:
    using CapabilityProbe = bool (*)();

    explicit SendfileStrategy(std::size_t fallback_buffer_size_kb = 1024,
                              CapabilityProbe probe = &adapters::fs::sendfile_supported,
                              adapters::fs::SendfileCall call = nullptr);

    [[nodiscard]] auto name() const -> std::string override { return "Sendfile"; }
    [[nodiscard]] auto description() const -> std::string override;
    [[nodiscard]] auto validate_prerequisites() const -> std::vector<std::string> override;

    [[nodiscard]] auto copy_directory(const std::filesystem::path& src,
                                      const std::filesystem::path& dst,
                                      bool exclude_git,
                                      const CopyOptions& options) const -> CopyResult override;

private:
    std::size_t fallback_buffer_size_kb_;
    CapabilityProbe probe_;
    adapters::fs::SendfileCall call_;
};

} // namespace dircopy::core

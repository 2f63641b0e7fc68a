#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "../../infra/error_handler/error.hpp"

namespace dircopy::core {

// Единица работы Parallel/Pipeline; живёт только внутри одного вызова
struct CopyTask {
    std::string name;
    std::filesystem::path source;
    std::filesystem::path destination;
    std::uint64_t expected_size = 0;
};

struct ComponentCopyReport {
    std::uint64_t bytes_copied = 0;    // фактически скопировано, без неудачных единиц
    std::uint64_t expected_bytes = 0;  // по данным фазы 1
    std::vector<std::string> failures; // "<name>: <error>"
};

/// Фаза 1: размеры компонентов параллельно на пуле из size_workers потоков.
/// Отсутствующие компоненты пропускаются.
[[nodiscard]] auto discover_component_sizes(const std::filesystem::path& src_base,
                                            const std::filesystem::path& dst_base,
                                            const std::vector<std::string>& components,
                                            std::uint32_t size_workers) -> std::vector<CopyTask>;

/// Копия одной единицы: поддерево целиком или одиночный файл.
/// Возвращает фактический размер после копирования.
[[nodiscard]] auto copy_component(const CopyTask& task, bool exclude_git) -> infra::Result<std::uint64_t>;

/// Фаза 2: по задаче на компонент на пуле из copy_workers потоков.
/// Ошибка одной единицы — warning, в bytes_copied не входит.
[[nodiscard]] auto copy_components(const std::vector<CopyTask>& tasks,
                                   std::uint32_t copy_workers,
                                   bool exclude_git) -> ComponentCopyReport;

} // namespace dircopy::core

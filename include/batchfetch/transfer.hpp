#pragma once

#include "download_task.hpp"

namespace batchfetch {

// Downloads one task. Implementations never throw for transport or
// filesystem problems; they log and return false.
class Transfer {
public:
    virtual ~Transfer() = default;

    [[nodiscard]] virtual bool run(const DownloadTask& task) = 0;
};

} // namespace batchfetch

#pragma once
#include <functional>

namespace app {

// Коды выхода benthic_tracker.
constexpr int kExitOk = 0;
constexpr int kExitError = 1;      // - конфигурация, источник, файловая система, OpenCV.
constexpr int kExitUsage = 2;
constexpr int kExitPartial = 3;    // - клип дочитан не до конца, результат частичный.

// Выполняет body; известные ошибки пишет в cerr и превращает в kExitError.
int guarded_run(const std::function<int()>& body);

} // namespace app

#pragma once

extern "C" {
#include "../common/view.h"  // ViewInterface, ViewHandle_t, InputEvent_t
}

/**
 * @brief Экземпляр Qt-интерфейса для Code Break.
 *
 * Реализует контракт ViewInterface на Qt Widgets. Перед init() должен
 * существовать QApplication; цикл событий Qt прокручивается в render().
 */
extern const ViewInterface qt_view;

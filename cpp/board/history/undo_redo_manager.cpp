#include "board/history/undo_redo_manager.h"
#include "board/core/logging.h"

#include <utility>

namespace board {

namespace {
    bool coalesces(TransactionOrigin origin) {
        switch (origin) {
            case TransactionOrigin::Gesture:
            case TransactionOrigin::Drag:
            case TransactionOrigin::TextEdit:
                return true;
            case TransactionOrigin::Baseline:
            case TransactionOrigin::Agent:
            case TransactionOrigin::Remote:
            case TransactionOrigin::History:
                return false;
        }
        return false;
    }
}

UndoRedoManager::UndoRedoManager(Document& doc, std::size_t capacity)
    : doc_(doc), capacity_(capacity == 0 ? 1 : capacity) {
    listener_ = doc_.addListener([this](const DocTransaction& record) { onTransaction(record); });
}

UndoRedoManager::~UndoRedoManager() {
    doc_.removeListener(listener_);
}

void UndoRedoManager::onTransaction(const DocTransaction& record) {
    if (record.origin == TransactionOrigin::Remote || record.origin == TransactionOrigin::History) return;

    redo_.clear();
    if (captureOpen_ && coalesces(record.origin) && !undo_.empty() && undo_.back().origin == record.origin) {
        undo_.back().records.push_back(record);
        return;
    }

    undo_.push_back(Step{record.origin, {record}});
    captureOpen_ = coalesces(record.origin);
    while (undo_.size() > capacity_) {
        undo_.erase(undo_.begin());
    }
}

bool UndoRedoManager::undo() {
    if (undo_.empty()) return false;
    Step step = std::move(undo_.back());
    undo_.pop_back();
    captureOpen_ = false;

    doc_.transact(TransactionOrigin::History, [&]() {
        for (auto it = step.records.rbegin(); it != step.records.rend(); ++it) {
            doc_.revert(*it);
        }
    });
    BOARD_LOG_DEBUG("undo %s step (%zu records)", transactionOriginName(step.origin), step.records.size());
    redo_.push_back(std::move(step));
    return true;
}

bool UndoRedoManager::redo() {
    if (redo_.empty()) return false;
    Step step = std::move(redo_.back());
    redo_.pop_back();
    captureOpen_ = false;

    doc_.transact(TransactionOrigin::History, [&]() {
        for (const auto& record : step.records) {
            doc_.replay(record);
        }
    });
    BOARD_LOG_DEBUG("redo %s step (%zu records)", transactionOriginName(step.origin), step.records.size());
    undo_.push_back(std::move(step));
    return true;
}

void UndoRedoManager::clear() {
    undo_.clear();
    redo_.clear();
    captureOpen_ = false;
}

} // namespace board

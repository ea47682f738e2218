/// @file StoreError.cpp
/// @brief "rowstore" error category implementation

#include <rowstore/store/StoreError.hpp>

namespace RowStore {

namespace {

class StoreCategory final : public std::error_category {
  public:
    const char* name() const noexcept override { return "rowstore"; }

    // 표시 계층이 그대로 사용자에게 보여줄 수 있는 문구를 반환한다.
    std::string message(int ev) const override {
        switch (static_cast<StoreErrc>(ev)) {
        case StoreErrc::NoError:
            return "no error";
        case StoreErrc::RecordExists:
            return "a record with this identifier already exists";
        case StoreErrc::RecordNotFound:
            return "record not found";
        case StoreErrc::ReadOnly:
            return "record is inactive and read-only; it can only be reactivated";
        case StoreErrc::NoDelete:
            return "record cannot be deleted: identifier not found";
        }
        return "unknown rowstore error";
    }
};

} // namespace

const std::error_category& storeCategory() noexcept {
    static const StoreCategory instance;
    return instance;
}

std::error_code make_error_code(StoreErrc e) noexcept {
    return std::error_code(static_cast<int>(e), storeCategory());
}

} // namespace RowStore

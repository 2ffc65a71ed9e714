#pragma once

#include <memory>
#include <memory_resource>
#include <string>

namespace core::pmr {

    template<class Target>
    void deallocate_ptr(std::pmr::memory_resource* ptr, Target* target, size_t size, size_t align);

    // size and align of the allocated object travel with the deleter so a derived object
    // owned through a base pointer is returned to the resource with its real layout
    class deleter_t final {
    public:
        explicit deleter_t(std::pmr::memory_resource* ptr, size_t size = 0, size_t align = 0)
            : ptr_(ptr)
            , size_(size)
            , align_(align) {}

        template<class T>
        void operator()(T* target) {
            deallocate_ptr(ptr_, target, size_ ? size_ : sizeof(T), align_ ? align_ : alignof(T));
        }

        std::pmr::memory_resource* resource() const noexcept { return ptr_; }

    private:
        std::pmr::memory_resource* ptr_;
        size_t size_;
        size_t align_;
    };

    template<class T>
    using unique_ptr = std::unique_ptr<T, deleter_t>;

    template<class Target, class... Args>
    unique_ptr<Target> make_unique(std::pmr::memory_resource* ptr, Args&&... args) {
        auto size = sizeof(Target);
        auto align = alignof(Target);
        auto* buffer = ptr->allocate(size, align);
        auto* target_ptr = new (buffer) Target(ptr, std::forward<Args>(args)...);
        return {target_ptr, deleter_t(ptr, size, align)};
    }

    template<class Base, class Target, class... Args>
    unique_ptr<Base> make_unique_as(std::pmr::memory_resource* ptr, Args&&... args) {
        auto size = sizeof(Target);
        auto align = alignof(Target);
        auto* buffer = ptr->allocate(size, align);
        Base* target_ptr = new (buffer) Target(ptr, std::forward<Args>(args)...);
        return {target_ptr, deleter_t(ptr, size, align)};
    }

    template<class Target>
    void deallocate_ptr(std::pmr::memory_resource* ptr, Target* target, size_t size, size_t align) {
        target->~Target();
        ptr->deallocate(target, size, align);
    }

} // namespace core::pmr

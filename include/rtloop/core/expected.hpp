#pragma once
#include <new>         // placement new and explicit destructor calls
#include <utility>     // move and forward
#include <type_traits> // noexcept() traits

#include "rtloop/core/error.hpp"
#include "rtloop/core/status.hpp"

namespace rtloop{

    /*
    Holds either a T (success) or an Error (failure), never both
        1. storage_ is a raw aligned buffer, T is placement-new'd into it -> no heap
        2. err_ stays default (kControlLoopError) while ok_ == true and is never read then
        3. every hot path operation is noexcept when T's copy/move is
    */
    template <class T>
    class Expected{
        public:
            // // Lvalue overload -> copies v into storage
            [[nodiscard]] static Expected success(const T& v) noexcept(std::is_nothrow_copy_constructible_v<T>){
                Expected e;
                e.ok_ = true;
                ::new (e.storage_) T(v);
                return e;
            }

            // // Rvalue overload
            [[nodiscard]] static Expected success(T&& v) noexcept(std::is_nothrow_move_constructible_v<T>){
                Expected e;
                e.ok_ = true;
                ::new (e.storage_) T(std::move(v));
                return e;
            }

            // // Direct construction of T in place from ctor args
            template <class ... Args>
            [[nodiscard]] static Expected emplace(Args&&... args) noexcept(std::is_nothrow_constructible_v<T, Args...>){
                Expected e;
                e.ok_ = true;
                ::new (e.storage_) T(std::forward<Args>(args)...);
                return e;
            }

            // // Failure with full payload
            [[nodiscard]] static Expected failure(const Error& err) noexcept{
                Expected e;
                e.ok_ = false;
                e.err_ = err;
                return e;
            }

            // // Failure with a bare code
            [[nodiscard]] static Expected failure(Status s) noexcept{
                return failure(Error::from_status(s));
            }

            Expected(const Expected& o) noexcept(std::is_nothrow_copy_constructible_v<T>) : err_(o.err_), ok_(o.ok_){
                if (ok_) ::new (storage_) T(*o.ptr());
            }

            Expected(Expected&& o) noexcept(std::is_nothrow_move_constructible_v<T>) : err_(o.err_), ok_(o.ok_){
                if (ok_) ::new (storage_) T(std::move(*o.ptr()));
                o.reset_();
            }

            Expected& operator=(const Expected& o) noexcept(std::is_nothrow_copy_constructible_v<T>){
                if (this == &o) return *this;
                reset_();
                err_ = o.err_;
                ok_ = o.ok_;
                if (ok_) ::new (storage_) T(*o.ptr());
                return *this;
            }

            Expected& operator=(Expected&& o) noexcept(std::is_nothrow_move_constructible_v<T>){
                if (this == &o) return *this;
                reset_();
                err_ = o.err_;
                ok_ = o.ok_;
                if (ok_) ::new (storage_) T(std::move(*o.ptr()));
                o.reset_();
                return *this;
            }

            ~Expected() noexcept{
                reset_();
            }

            [[nodiscard]] bool has_value() const noexcept{
                return ok_;
            }

            [[nodiscard]] explicit operator bool() const noexcept{
                return ok_;
            }

            [[nodiscard]] Status status() const noexcept{
                return ok_ ? Status::kOK : err_.code;
            }

            // // accessors: caller checks has_value() first
            [[nodiscard]] T& value() noexcept{
                return *ptr();
            }

            [[nodiscard]] const T& value() const noexcept{
                return *ptr();
            }

            // // only meaningful when !has_value()
            [[nodiscard]] const Error& error() const noexcept{
                return err_;
            }

            // // move the value out, leaves *this empty
            [[nodiscard]] T take() noexcept(std::is_nothrow_move_constructible_v<T>){
                T tmp = std::move(*ptr());
                ptr()->~T();
                ok_ = false;
                return tmp;
            }

        private:
            alignas(T) unsigned char storage_[sizeof(T)]{};

            Error err_{};

            bool ok_{false};

            T* ptr() noexcept{
                return std::launder(reinterpret_cast<T*>(storage_));
            }

            const T* ptr() const noexcept{
                return std::launder(reinterpret_cast<const T*>(storage_));
            }

            void reset_() noexcept{
                if (ok_){
                    ptr()->~T();
                    ok_ = false;
                }
            }

            Expected() = default;
    };

    /*
    Outcome of an operation with no value: ok or Error
    */
    class [[nodiscard]] Outcome{
        public:
            static Outcome ok() noexcept{
                return Outcome{};
            }

            static Outcome failure(const Error& e) noexcept{
                Outcome o;
                o.ok_ = false;
                o.err_ = e;
                return o;
            }

            bool has_value() const noexcept{
                return ok_;
            }

            explicit operator bool() const noexcept{
                return ok_;
            }

            Status status() const noexcept{
                return ok_ ? Status::kOK : err_.code;
            }

            const Error& error() const noexcept{
                return err_;
            }

        private:
            Outcome() = default;
            Error err_{};
            bool ok_{true};
    };

} // namespace rtloop

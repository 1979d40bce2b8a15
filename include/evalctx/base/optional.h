#pragma once

#include <evalctx/base/fwd/optional.h>

#include <evalctx/base/checks.h>
#include <evalctx/base/lineinfo.h>

#include <new>
#include <type_traits>
#include <utility>

namespace evalctx
{
    struct NullOpt
    {
        explicit constexpr NullOpt(int) { }
    };

    const static constexpr NullOpt nullopt{0};

    namespace details
    {
        template<class T>
        struct OptionalStorage
        {
            OptionalStorage() noexcept : m_is_present(false), m_inactive() { }
            OptionalStorage(const T& t) : m_is_present(true), m_t(t) { }
            OptionalStorage(T&& t) noexcept(std::is_nothrow_move_constructible_v<T>)
                : m_is_present(true), m_t(std::move(t))
            {
            }

            OptionalStorage(const OptionalStorage& o) : m_is_present(false), m_inactive()
            {
                if (o.m_is_present)
                {
                    new (&m_t) T(o.m_t);
                    m_is_present = true;
                }
            }

            OptionalStorage(OptionalStorage&& o) noexcept(std::is_nothrow_move_constructible_v<T>)
                : m_is_present(false), m_inactive()
            {
                if (o.m_is_present)
                {
                    new (&m_t) T(std::move(o.m_t));
                    m_is_present = true;
                }
            }

            OptionalStorage& operator=(const OptionalStorage& o)
            {
                if (this != &o)
                {
                    if (o.m_is_present)
                    {
                        emplace(o.m_t);
                    }
                    else if (m_is_present)
                    {
                        destroy();
                    }
                }

                return *this;
            }

            OptionalStorage& operator=(OptionalStorage&& o) noexcept // enforces termination
            {
                if (o.m_is_present)
                {
                    emplace(std::move(o.m_t));
                }
                else if (m_is_present)
                {
                    destroy();
                }

                return *this;
            }

            ~OptionalStorage()
            {
                if (m_is_present)
                {
                    m_t.~T();
                }
            }

            constexpr bool has_value() const noexcept { return m_is_present; }

            const T& value() const noexcept { return m_t; }
            T& value() noexcept { return m_t; }

            const T* get() const& noexcept { return m_is_present ? &m_t : nullptr; }
            T* get() & noexcept { return m_is_present ? &m_t : nullptr; }
            const T* get() const&& = delete;
            T* get() && = delete;

            template<class... Args>
            T& emplace(Args&&... args)
            {
                if (m_is_present) destroy();
                new (&m_t) T(static_cast<Args&&>(args)...);
                m_is_present = true;
                return m_t;
            }

            void destroy() noexcept
            {
                m_is_present = false;
                m_t.~T();
                m_inactive = '\0';
            }

        private:
            bool m_is_present;
            union
            {
                char m_inactive;
                T m_t;
            };
        };

        template<class T>
        struct OptionalStorage<T&>
        {
            constexpr OptionalStorage() noexcept : m_t(nullptr) { }
            constexpr OptionalStorage(T& t) noexcept : m_t(&t) { }
            constexpr OptionalStorage(Optional<T>& t) noexcept : m_t(t.get()) { }

            constexpr bool has_value() const noexcept { return m_t != nullptr; }

            T& value() const noexcept { return *m_t; }

            T* get() const noexcept { return m_t; }

            T& emplace(T& t) noexcept
            {
                m_t = &t;
                return *m_t;
            }

            void destroy() noexcept { m_t = nullptr; }

        private:
            T* m_t;
        };

        template<class T>
        struct OptionalStorage<const T&>
        {
            constexpr OptionalStorage() noexcept : m_t(nullptr) { }
            constexpr OptionalStorage(const T& t) noexcept : m_t(&t) { }
            constexpr OptionalStorage(const Optional<T>& t) noexcept : m_t(t.get()) { }
            OptionalStorage(Optional<T>&& t) = delete;

            constexpr bool has_value() const noexcept { return m_t != nullptr; }

            const T& value() const noexcept { return *m_t; }

            const T* get() const noexcept { return m_t; }

            const T& emplace(const T& t) noexcept
            {
                m_t = &t;
                return *m_t;
            }

            void destroy() noexcept { m_t = nullptr; }

        private:
            const T* m_t;
        };
    }

    template<class T>
    struct Optional : private details::OptionalStorage<T>
    {
        constexpr Optional() noexcept { }

        // Constructors are intentionally implicit
        constexpr Optional(NullOpt) noexcept { }

        template<class U,
                 std::enable_if_t<!std::is_same_v<std::decay_t<U>, Optional> &&
                                      std::is_constructible_v<details::OptionalStorage<T>, U>,
                                  int> = 0>
        constexpr Optional(U&& t) : details::OptionalStorage<T>(static_cast<U&&>(t))
        {
        }

        using details::OptionalStorage<T>::emplace;
        using details::OptionalStorage<T>::has_value;
        using details::OptionalStorage<T>::get;

        T&& value_or_exit(const LineInfo& line_info) && noexcept
        {
            Checks::check_exit(line_info, this->has_value(), "Value was null");
            return std::move(this->value());
        }

        T& value_or_exit(const LineInfo& line_info) & noexcept
        {
            Checks::check_exit(line_info, this->has_value(), "Value was null");
            return this->value();
        }

        const T& value_or_exit(const LineInfo& line_info) const& noexcept
        {
            Checks::check_exit(line_info, this->has_value(), "Value was null");
            return this->value();
        }

        constexpr explicit operator bool() const noexcept { return this->has_value(); }

        template<class U>
        std::decay_t<T> value_or(U&& default_value) const&
        {
            return this->has_value() ? this->value() : static_cast<std::decay_t<T>>(std::forward<U>(default_value));
        }

        template<class F>
        using map_t = decltype(std::declval<F&>()(std::declval<const T&>()));

        template<class F>
        Optional<map_t<F>> map(F f) const&
        {
            if (this->has_value())
            {
                return f(this->value());
            }
            return nullopt;
        }

        void clear() noexcept
        {
            if (this->has_value())
            {
                this->destroy();
            }
        }
    };

    // these cannot be hidden friends, unfortunately
    template<class T, class U>
    auto operator==(const Optional<T>& lhs, const Optional<U>& rhs) -> decltype(*lhs.get() == *rhs.get())
    {
        if (lhs.has_value() && rhs.has_value())
        {
            return *lhs.get() == *rhs.get();
        }
        return lhs.has_value() == rhs.has_value();
    }
    template<class T, class U>
    auto operator==(const Optional<T>& lhs, const U& rhs) -> decltype(*lhs.get() == rhs)
    {
        return lhs.has_value() && *lhs.get() == rhs;
    }
    template<class T, class U>
    auto operator!=(const Optional<T>& lhs, const Optional<U>& rhs) -> decltype(*lhs.get() != *rhs.get())
    {
        return !(lhs == rhs);
    }
    template<class T, class U>
    auto operator!=(const Optional<T>& lhs, const U& rhs) -> decltype(*lhs.get() != rhs)
    {
        return !lhs.has_value() || *lhs.get() != rhs;
    }
}

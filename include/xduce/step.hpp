/*
================================================================================

                             PUBLIC DOMAIN NOTICE
                 National Center for Biotechnology Information

  This software is a "United States Government Work" under the terms of the
  United States Copyright Act.  It was written as part of the author's official
  duties as a United States Government employees and thus cannot be copyrighted.
  This software is freely available to the public for use. The National Library
  of Medicine and the U.S. Government have not placed any restriction on its use
  or reproduction.

  Although all reasonable efforts have been taken to ensure the accuracy and
  reliability of this software, the NLM and the U.S. Government do not and
  cannot warrant the performance or results that may be obtained by using this
  software. The NLM and the U.S. Government disclaim all warranties, expressed
  or implied, including warranties of performance, merchantability or fitness
  for any particular purpose.

  Please cite NCBI in any work or product based on this material.

================================================================================
*/
#ifndef XDUCE_STEP_HPP_
#define XDUCE_STEP_HPP_

#include <stdexcept> // std::logic_error for XDUCE_TD_THROW
#include <string>    // for to_string
#include <type_traits>
#include <utility>
#include <new>
#include <cassert>

#define XDUCE_TD_THROW(msg) throw std::logic_error( std::string{} + __FILE__ + ":" + std::to_string(__LINE__) + ": "#msg );

namespace xduce
{

/// @brief Transducers: composable transformations of reducing functions.
namespace td
{

    /////////////////////////////////////////////////////////////////////////
    /// @brief Bare-bones optional value.
    ///
    /// Returned by collectors that may have nothing to report
    /// (`first`, `last`, `find`, `min`, `max`), and used internally
    /// to hold state that may not be default-constructible
    /// (e.g. the last forwarded value in `unique`).
    template<class T>
    class maybe
    {
       struct sentinel{};
       union
       {
           sentinel m_sentinel;
                  T m_value;
       };

       bool m_empty = true;

    public:
        using value_type = T;

        static_assert(!std::is_same<value_type, void>::value, "Can't have void as value_type - did you perhaps forget a return-statement in your transform-function?");

        maybe() : m_sentinel{}
        {}

        maybe(T val) : m_sentinel{}
        {
            reset(std::move(val));
        }

        maybe(const maybe& other) : m_sentinel{}
        {
            if(!other.m_empty) {
                reset(*other);
            }
        }

        maybe(maybe&& other) noexcept : m_sentinel{}
        {
            if(!other.m_empty) {
                reset(std::move(*other));
                other.reset();
            }
        }

        maybe& operator=(const maybe& other)
        {
            if(this == &other) {
                ;
            } else if(!other.m_empty) {
                reset(*other); // copies before destroying our own value
            } else {
                reset();
            }
            return *this;
        }

        // NB: like the copy-assignment, this destroys and placement-news
        // rather than assigning to the held value, because T may be
        // move-constructible but not move-assignable (e.g. holding a closure).
        maybe& operator=(maybe&& other) noexcept
        {
            if(this == &other) {
                ;
            } else if(!other.m_empty) {
                reset(std::move(*other));
                other.reset();
            } else {
                reset();
            }
            return *this;
        }

        void reset(T val)
        {
            reset();
            new (&m_value) T(std::move(val));
            m_empty = false;
        }

        void reset()
        {
            if(!m_empty) {
                m_value.~T();
                m_empty = true;
            }
        }

        explicit operator bool() const noexcept
        {
            return !m_empty;
        }

        T& operator*() noexcept
        {
            assert(!m_empty);
            return m_value;
        }

        const T& operator*() const noexcept
        {
            assert(!m_empty);
            return m_value;
        }

        T* operator->() noexcept
        {
            return &**this;
        }

        const T* operator->() const noexcept
        {
            return &**this;
        }

        T value_or(T dflt) const
        {
            return m_empty ? std::move(dflt) : m_value;
        }

        bool operator==(const maybe& other) const
        {
            return m_empty || other.m_empty ? m_empty == other.m_empty
                                            : m_value == other.m_value;
        }

        bool operator!=(const maybe& other) const
        {
            return !(*this == other);
        }

        ~maybe()
        {
            reset();
        }
    };

    /////////////////////////////////////////////////////////////////////////
    /// @brief Result of one reduction step: the next accumulator, tagged
    /// continue or stop.
    ///
    /// The tag is a control signal only; a stopped step is not an error,
    /// and its payload is the final accumulator.
    ///
    /// `step` is a monad (unit = `cont`, bind = `bind`):
    /*!
    @code
        auto f = [](int x) { return td::cont(x * 2); };
        auto g = [](int x) { return td::cont(x + 10); };

        VERIFY(td::cont(42).bind(f) == f(42));                 // left identity
        VERIFY(m.bind([](int x){ return td::cont(x); }) == m); // right identity
        VERIFY(m.bind(f).bind(g) == m.bind([&](int x){ return f(x).bind(g); }));
    @endcode
    */
    template<typename T>
    class step
    {
        // declared ahead of the members whose return types name them
           T m_value;
        bool m_stopped;

    public:
        using value_type = T;

        // Prefer td::cont(...) and td::stop(...)
        step(T value, bool stopped)
            : m_value( std::move(value) )
            , m_stopped{ stopped }
        {}

        bool is_continue() const noexcept
        {
            return !m_stopped;
        }

        bool is_stop() const noexcept
        {
            return m_stopped;
        }

        /// Payload, regardless of the tag.
        T unwrap() &&
        {
            return std::move(m_value);
        }

        const T& unwrap() const &
        {
            return m_value;
        }

        /// Transform the payload, preserving the tag.
        template<typename F>
        auto map(F fn) && -> step<typename std::decay<decltype(fn(std::move(m_value)))>::type>
        {
            return { fn(std::move(m_value)), m_stopped };
        }

        template<typename F>
        auto map(F fn) const & -> step<typename std::decay<decltype(fn(m_value))>::type>
        {
            return { fn(m_value), m_stopped };
        }

        /// Continue dispatches to `fn`; stop short-circuits, carrying
        /// the payload over as the value_type of fn's result.
        template<typename F>
        auto bind(F fn) && -> decltype(fn(std::move(m_value)))
        {
            using ret_t = decltype(fn(std::move(m_value)));
            using U = typename ret_t::value_type;

            if(m_stopped) {
                return { U(std::move(m_value)), true };
            }
            return fn(std::move(m_value));
        }

        template<typename F>
        auto bind(F fn) const & -> decltype(fn(m_value))
        {
            using ret_t = decltype(fn(m_value));
            using U = typename ret_t::value_type;

            if(m_stopped) {
                return { U(m_value), true };
            }
            return fn(m_value);
        }

        /// Payload if continuing; empty if stopped.
        maybe<T> continue_value() &&
        {
            return m_stopped ? maybe<T>{} : maybe<T>{ std::move(m_value) };
        }

        bool operator==(const step& other) const
        {
            return m_stopped == other.m_stopped && m_value == other.m_value;
        }

        bool operator!=(const step& other) const
        {
            return !(*this == other);
        }
    };

    /// @brief Continue the reduction with `value` as the accumulator.
    template<typename T>
    step<typename std::decay<T>::type> cont(T&& value)
    {
        return { std::forward<T>(value), false };
    }

    /// @brief Stop the reduction with `value` as the final accumulator.
    template<typename T>
    step<typename std::decay<T>::type> stop(T&& value)
    {
        return { std::forward<T>(value), true };
    }

} // namespace td

} // namespace xduce

#endif // #ifndef XDUCE_STEP_HPP_

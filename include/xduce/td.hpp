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
#ifndef XDUCE_TD_HPP_
#define XDUCE_TD_HPP_

#include "step.hpp"

#include <vector>
#include <deque>
#include <set>
#include <functional>
#include <iterator>

namespace xduce
{

namespace td
{

    /*
     * A transducer is a value-type configuration object that maps a
     * reducing function over its outputs into a reducing function over
     * its inputs. It exposes:
     *
     *      template<typename In>
     *      using output = ...;             // element-type it forwards, given In
     *
     *      template<typename In, typename Rf>
     *      auto apply(Rf next) const;      // build the upstream reducing function
     *
     * A reducing function is any callable `(Acc, X) -> step<Acc>`.
     * The reducing functions built by apply are function-objects with
     * a call-operator templated on Acc, so no type-erasure takes place
     * within a chain, and building a chain does not allocate.
     *
     * Stateful transducers (take, drop, unique, scan, chunk, ...) keep
     * their state in the reducing function built by apply, not in the
     * configuration object, so every drive starts from fresh state,
     * and the same transducer can be used to build any number of drivers.
     */

namespace impl
{
    /////////////////////////////////////////////////////////////////////////
    // Result-type of invoking F with args, decayed.
    template<typename F, typename... Args>
    using invoke_result_t = typename std::decay<decltype(std::declval<F&>()(std::declval<Args>()...))>::type;

    /////////////////////////////////////////////////////////////////////////
    struct identity
    {
        template<typename In>
        using output = In;

        template<typename In, typename Rf>
        Rf apply(Rf next) const
        {
            return next;
        }
    };

    /////////////////////////////////////////////////////////////////////////
    // Xf1 is upstream (sees the inputs first), Xf2 is downstream.
    template<typename Xf1, typename Xf2>
    struct compose
    {
        Xf1 first;
        Xf2 second;

        template<typename In>
        using mid_t = typename Xf1::template output<In>;

        template<typename In>
        using output = typename Xf2::template output<mid_t<In>>;

        template<typename In, typename Rf>
        auto apply(Rf next) const
          -> decltype(first.template apply<In>(second.template apply<mid_t<In>>(std::move(next))))
        {
            // wrap the terminal reducer with the downstream stage first,
            // and then wrap that with the upstream stage.
            return first.template apply<In>(
                      second.template apply<mid_t<In>>(
                          std::move(next)));
        }
    };

    /////////////////////////////////////////////////////////////////////////
    template<typename F>
    struct map
    {
        F map_fn;

        template<typename In>
        using output = invoke_result_t<F, In>;

        template<typename In, typename Rf>
        struct rf
        {
            Rf next;
             F map_fn; // NB: non-const, may be a mutable lambda (e.g. counting)

            static_assert(!std::is_same<output<In>, void>::value, "You forgot a return-statement in your transform-function.");

            template<typename Acc>
            step<Acc> operator()(Acc acc, In x)
            {
                return next(std::move(acc), map_fn(std::move(x)));
            }
        };

        template<typename In, typename Rf>
        rf<In, Rf> apply(Rf next) const
        {
            return { std::move(next), map_fn };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    // Rejected inputs leave the accumulator unchanged and continue;
    // filtering never stops the reduction.
    template<typename Pred>
    struct filter
    {
        Pred pred;

        template<typename In>
        using output = In;

        template<typename In, typename Rf>
        struct rf
        {
              Rf next;
            Pred pred;

            template<typename Acc>
            step<Acc> operator()(Acc acc, In x)
            {
                if(!pred(static_cast<const In&>(x))) {
                    return td::cont(std::move(acc));
                }
                return next(std::move(acc), std::move(x));
            }
        };

        template<typename In, typename Rf>
        rf<In, Rf> apply(Rf next) const
        {
            return { std::move(next), pred };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    struct take
    {
        size_t n;

        template<typename In>
        using output = In;

        template<typename In, typename Rf>
        struct rf
        {
                Rf next;
            size_t n;
            size_t num_taken;

            template<typename Acc>
            step<Acc> operator()(Acc acc, In x)
            {
                if(num_taken >= n) {
                    return td::stop(std::move(acc)); // n == 0
                }

                ++num_taken;
                auto ret = next(std::move(acc), std::move(x));

                if(num_taken >= n) {
                    // stop on the n-th forward, rather than
                    // on the next input, so that we don't pull
                    // one more element from upstream than necessary.
                    return td::stop(std::move(ret).unwrap());
                }
                return ret;
            }
        };

        template<typename In, typename Rf>
        rf<In, Rf> apply(Rf next) const
        {
            return { std::move(next), n, 0 };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    template<typename Pred>
    struct take_while
    {
        Pred pred;

        template<typename In>
        using output = In;

        template<typename In, typename Rf>
        struct rf
        {
              Rf next;
            Pred pred;

            template<typename Acc>
            step<Acc> operator()(Acc acc, In x)
            {
                if(!pred(static_cast<const In&>(x))) {
                    return td::stop(std::move(acc)); // the unsatisfying element is not forwarded
                }
                return next(std::move(acc), std::move(x));
            }
        };

        template<typename In, typename Rf>
        rf<In, Rf> apply(Rf next) const
        {
            return { std::move(next), pred };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    struct drop
    {
        size_t n;

        template<typename In>
        using output = In;

        template<typename In, typename Rf>
        struct rf
        {
                Rf next;
            size_t n;
            size_t num_dropped;

            template<typename Acc>
            step<Acc> operator()(Acc acc, In x)
            {
                if(num_dropped < n) {
                    ++num_dropped;
                    return td::cont(std::move(acc));
                }
                return next(std::move(acc), std::move(x));
            }
        };

        template<typename In, typename Rf>
        rf<In, Rf> apply(Rf next) const
        {
            return { std::move(next), n, 0 };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    template<typename Pred>
    struct drop_while
    {
        Pred pred;

        template<typename In>
        using output = In;

        template<typename In, typename Rf>
        struct rf
        {
              Rf next;
            Pred pred;
            bool found_unsatisfying; // one-way latch: once set, pred is no longer consulted

            template<typename Acc>
            step<Acc> operator()(Acc acc, In x)
            {
                if(!found_unsatisfying && pred(static_cast<const In&>(x))) {
                    return td::cont(std::move(acc));
                }
                found_unsatisfying = true;
                return next(std::move(acc), std::move(x));
            }
        };

        template<typename In, typename Rf>
        rf<In, Rf> apply(Rf next) const
        {
            return { std::move(next), pred, false };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    // Forward x unless key_fn(x) equals the key of the previously forwarded element.
    template<typename F>
    struct unique_adjacent_by
    {
        F key_fn;

        template<typename In>
        using output = In;

        template<typename In, typename Rf>
        struct rf
        {
            using key_t = invoke_result_t<F, const In&>;

            Rf next;
             F key_fn;
            maybe<key_t> last_key; // maybe, because key_t might not be default-constructible

            template<typename Acc>
            step<Acc> operator()(Acc acc, In x)
            {
                auto k = key_fn(static_cast<const In&>(x));

                if(last_key && *last_key == k) {
                    return td::cont(std::move(acc));
                }

                last_key.reset(std::move(k));
                return next(std::move(acc), std::move(x));
            }
        };

        template<typename In, typename Rf>
        rf<In, Rf> apply(Rf next) const
        {
            return { std::move(next), key_fn, {} };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    // Forward x unless key_fn(x) was seen before, anywhere upstream.
    template<typename F>
    struct unique_by
    {
        F key_fn;

        template<typename In>
        using output = In;

        template<typename In, typename Rf>
        struct rf
        {
            using key_t = invoke_result_t<F, const In&>;
            // decayed, because we'll be storing keys in a set, and
            // they must not refer to the (moved-from) inputs.

            Rf next;
             F key_fn;
            std::set<key_t> seen;

            template<typename Acc>
            step<Acc> operator()(Acc acc, In x)
            {
                if(!seen.insert(key_fn(static_cast<const In&>(x))).second) {
                    return td::cont(std::move(acc));
                }
                return next(std::move(acc), std::move(x));
            }
        };

        template<typename In, typename Rf>
        rf<In, Rf> apply(Rf next) const
        {
            return { std::move(next), key_fn, {} };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    template<typename S, typename F>
    struct scan
    {
        S init;
        F fold_op;

        template<typename In>
        using output = S;

        template<typename In, typename Rf>
        struct rf
        {
            Rf next;
             F fold_op;
             S state;

            template<typename Acc>
            step<Acc> operator()(Acc acc, In x)
            {
                state = fold_op(static_cast<const S&>(state), static_cast<const In&>(x));
                return next(std::move(acc), S(state));
            }
        };

        template<typename In, typename Rf>
        rf<In, Rf> apply(Rf next) const
        {
            return { std::move(next), fold_op, init };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    template<typename F>
    struct tap
    {
        F fn;

        template<typename In>
        using output = In;

        template<typename In, typename Rf>
        struct rf
        {
            Rf next;
             F fn;

            template<typename Acc>
            step<Acc> operator()(Acc acc, In x)
            {
                fn(static_cast<const In&>(x));
                return next(std::move(acc), std::move(x));
            }
        };

        template<typename In, typename Rf>
        rf<In, Rf> apply(Rf next) const
        {
            return { std::move(next), fn };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    template<typename F>
    struct flat_map
    {
        F fn;

        template<typename In>
        using subseq_t = invoke_result_t<F, In>;

        template<typename In>
        using output = typename std::decay<decltype(*std::begin(std::declval<subseq_t<In>&>()))>::type;

        template<typename In, typename Rf>
        struct rf
        {
            Rf next;
             F fn;

            template<typename Acc>
            step<Acc> operator()(Acc acc, In x)
            {
                auto subseq = fn(std::move(x));

                for(auto it = std::begin(subseq); it != std::end(subseq); ++it) {
                    auto ret = next(std::move(acc), std::move(*it));

                    if(ret.is_stop()) {
                        return ret; // the rest of subseq is discarded
                    }
                    acc = std::move(ret).unwrap();
                }
                return td::cont(std::move(acc));
            }
        };

        template<typename In, typename Rf>
        rf<In, Rf> apply(Rf next) const
        {
            return { std::move(next), fn };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    // Trailing partial chunk is discarded: there's no completion-step
    // in the reducing function protocol to flush it.
    struct chunk
    {
        size_t chunk_size;

        template<typename In>
        using output = std::vector<In>;

        template<typename In, typename Rf>
        struct rf
        {
                         Rf next;
                     size_t chunk_size;
            std::vector<In> buf;

            template<typename Acc>
            step<Acc> operator()(Acc acc, In x)
            {
                buf.push_back(std::move(x));

                if(buf.size() < chunk_size) {
                    return td::cont(std::move(acc));
                }

                std::vector<In> full{};
                full.reserve(chunk_size);
                full.swap(buf);

                return next(std::move(acc), std::move(full));
            }
        };

        template<typename In, typename Rf>
        rf<In, Rf> apply(Rf next) const
        {
            return { std::move(next), chunk_size, {} };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    template<typename T>
    struct interpose
    {
        T delim;

        template<typename In>
        using output = In;

        template<typename In, typename Rf>
        struct rf
        {
              Rf next;
              In delim;
            bool started;

            template<typename Acc>
            step<Acc> operator()(Acc acc, In x)
            {
                if(!started) {
                    started = true;
                    return next(std::move(acc), std::move(x));
                }

                auto ret = next(std::move(acc), In(delim));
                if(ret.is_stop()) {
                    return ret;
                }
                return next(std::move(ret).unwrap(), std::move(x));
            }
        };

        template<typename In, typename Rf>
        rf<In, Rf> apply(Rf next) const
        {
            return { std::move(next), In(delim), false };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    struct repeat_each
    {
        size_t n;

        template<typename In>
        using output = In;

        template<typename In, typename Rf>
        struct rf
        {
                Rf next;
            size_t n;

            template<typename Acc>
            step<Acc> operator()(Acc acc, In x)
            {
                for(size_t i = 0; i < n; i++) {
                    auto ret = next(std::move(acc), In(static_cast<const In&>(x)));

                    if(ret.is_stop()) {
                        return ret;
                    }
                    acc = std::move(ret).unwrap();
                }
                return td::cont(std::move(acc));
            }
        };

        template<typename In, typename Rf>
        rf<In, Rf> apply(Rf next) const
        {
            return { std::move(next), n };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    // Sliding window; the last win_size inputs are cached in a deque.
    struct aperture
    {
        size_t win_size;

        template<typename In>
        using output = std::vector<In>;

        template<typename In, typename Rf>
        struct rf
        {
                        Rf next;
                    size_t win_size;
            std::deque<In> window;

            template<typename Acc>
            step<Acc> operator()(Acc acc, In x)
            {
                window.push_back(std::move(x));

                if(window.size() > win_size) {
                    window.pop_front();
                }

                if(window.size() < win_size) {
                    return td::cont(std::move(acc));
                }
                return next(std::move(acc), std::vector<In>(window.begin(), window.end()));
            }
        };

        template<typename In, typename Rf>
        rf<In, Rf> apply(Rf next) const
        {
            return { std::move(next), win_size, {} };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    // Forward on_true(x) or on_false(x); used by when, unless, if_else.
    template<typename Pred, typename F1, typename F2>
    struct if_else
    {
        Pred pred;
          F1 on_true;
          F2 on_false;

        template<typename In>
        using output = In;

        template<typename In, typename Rf>
        struct rf
        {
              Rf next;
            Pred pred;
              F1 on_true;
              F2 on_false;

            template<typename Acc>
            step<Acc> operator()(Acc acc, In x)
            {
                if(pred(static_cast<const In&>(x))) {
                    return next(std::move(acc), In(on_true(std::move(x))));
                }
                return next(std::move(acc), In(on_false(std::move(x))));
            }
        };

        template<typename In, typename Rf>
        rf<In, Rf> apply(Rf next) const
        {
            return { std::move(next), pred, on_true, on_false };
        }
    };

    /////////////////////////////////////////////////////////////////////////
    // Predicate combinators.
    // NB: the component predicates are expected to be const-invocable.

    template<typename P1, typename P2>
    struct both
    {
        P1 pred1;
        P2 pred2;

        template<typename T>
        bool operator()(const T& x) const
        {
            return pred1(x) && pred2(x);
        }
    };

    template<typename P1, typename P2>
    struct either
    {
        P1 pred1;
        P2 pred2;

        template<typename T>
        bool operator()(const T& x) const
        {
            return pred1(x) || pred2(x);
        }
    };

    template<typename P>
    struct complement
    {
        P pred;

        template<typename T>
        bool operator()(const T& x) const
        {
            return !pred(x);
        }

        // for stateful (mutable) predicates
        template<typename T>
        bool operator()(const T& x)
        {
            return !pred(x);
        }
    };

    template<typename T>
    struct all_pass
    {
        std::vector<std::function<bool(const T&)>> preds;

        bool operator()(const T& x) const
        {
            for(const auto& pred : preds) {
                if(!pred(x)) {
                    return false;
                }
            }
            return true;
        }
    };

    template<typename T>
    struct any_pass
    {
        std::vector<std::function<bool(const T&)>> preds;

        bool operator()(const T& x) const
        {
            for(const auto& pred : preds) {
                if(pred(x)) {
                    return true;
                }
            }
            return false;
        }
    };

}   // namespace impl

    /// @brief Element-type forwarded by transducer `Xf` when fed with `In`.
    template<typename Xf, typename In>
    using output_t = typename Xf::template output<In>;

    /// @brief Build a reducing function over `In` from a reducing function over `output_t<Xf, In>`.
    template<typename In, typename Xf, typename Rf>
    auto apply(const Xf& xf, Rf next) -> decltype(xf.template apply<In>(std::move(next)))
    {
        return xf.template apply<In>(std::move(next));
    }

    /////////////////////////////////////////////////////////////////////////
    /// @brief Key-functions.
namespace by
{
    struct identity
    {
        template<typename T>
        T&& operator()(T&& x) const
        {
            return std::forward<T>(x);
        }
    };
}   // namespace by


    /// @defgroup compose Identity and Composition
    /// @{

    /// @brief The identity transducer: forwards inputs unchanged.
    ///
    /// `compose(identity(), xf)` and `compose(xf, identity())` behave as `xf`.
    inline impl::identity identity()
    {
        return {};
    }

    /////////////////////////////////////////////////////////////////////////
    /// @brief Compose transducers; `xf1` sees the inputs first.
    ///
    /// `apply(compose(xf1, xf2), rf)` is `apply(xf1, apply(xf2, rf))`.
    /// Composition is associative, so `compose(a, b, c)`, which folds left,
    /// behaves the same as `compose(a, compose(b, c))`.
    /*!
    @code
        const auto xf = td::compose(
            td::map([](int x) { return x * 2; }),
            td::filter([](int x) { return x % 3 == 0; }),
            td::take(5));

        VERIFY(( td::to_vector(xf, td::range(1, 100)) == vec_t{{ 6, 12, 18, 24, 30 }} ));
    @endcode
    */
    template<typename Xf1, typename Xf2>
    impl::compose<Xf1, Xf2> compose(Xf1 xf1, Xf2 xf2)
    {
        return { std::move(xf1), std::move(xf2) };
    }

    template<typename Xf1, typename Xf2, typename Xf3, typename... Xfs>
    auto compose(Xf1 xf1, Xf2 xf2, Xf3 xf3, Xfs... xfs)
    {
        return td::compose(td::compose(std::move(xf1), std::move(xf2)),
                           std::move(xf3),
                           std::move(xfs)...);
    }

    /// @}
    /// @defgroup transform Transforming
    /// @{

    /// @brief Forward `map_fn(x)` for every input `x`.
    ///
    /// `compose(map(f), map(g))` behaves as `map(x => g(f(x)))`.
    template<typename F>
    impl::map<F> map(F map_fn)
    {
        return { std::move(map_fn) };
    }

    /// @brief Running fold: forward the updated state after each input.
    ///
    /// `state = fold_op(state, x)`; the output type is that of `init`,
    /// which may differ from the input type.
    /*!
    @code
        auto res = td::to_vector(
            td::scan(0, [](int out, int in) { return out + in; }),
            vec_t{{ 1, 2, 3, 4, 5 }});

        VERIFY(( res == vec_t{{ 1, 3, 6, 10, 15 }} ));
    @endcode
    */
    template<typename S, typename F>
    impl::scan<S, F> scan(S init, F fold_op)
    {
        return { std::move(init), std::move(fold_op) };
    }

    /// @brief Invoke `fn(x)` for side-effect and forward `x` unchanged.
    template<typename F>
    impl::tap<F> tap(F fn)
    {
        return { std::move(fn) };
    }

    /// @brief Forward each element of the (finite) iterable `fn(x)`.
    ///
    /// If downstream signals stop mid-expansion, the remaining
    /// elements of `fn(x)` are discarded without being forwarded.
    template<typename F>
    impl::flat_map<F> flat_map(F fn)
    {
        return { std::move(fn) };
    }

    /// @brief Forward `delim` between consecutive inputs.
    template<typename T>
    impl::interpose<T> interpose(T delim)
    {
        return { std::move(delim) };
    }

    /// @brief Forward every input `n` times.
    inline impl::repeat_each repeat_each(size_t n)
    {
        return { n };
    }

    /// @brief Forward `fn(x)` if `pred(x)`, otherwise `x`.
    template<typename P, typename F>
    impl::if_else<P, F, by::identity> when(P pred, F fn)
    {
        return { std::move(pred), std::move(fn), {} };
    }

    /// @brief Forward `fn(x)` unless `pred(x)`, otherwise `x`.
    template<typename P, typename F>
    impl::if_else<P, by::identity, F> unless(P pred, F fn)
    {
        return { std::move(pred), {}, std::move(fn) };
    }

    /// @brief Forward `pred(x) ? on_true(x) : on_false(x)`.
    template<typename P, typename F1, typename F2>
    impl::if_else<P, F1, F2> if_else(P pred, F1 on_true, F2 on_false)
    {
        return { std::move(pred), std::move(on_true), std::move(on_false) };
    }

    /// @}
    /// @defgroup filtering Filtering
    /// @{

    ///////////////////////////////////////////////////////////////////////////
    /// @brief Forward inputs satisfying the predicate.
    ///
    /// The predicate is invoked with a const-reference to the input.
    /// `compose(filter(p), filter(q))` behaves as `filter(x => p(x) && q(x))`.
    template<typename P>
    impl::filter<P> filter(P pred)
    {
        return { std::move(pred) };
    }

    /// @brief Forward inputs not satisfying the predicate; same as `filter(complement(pred))`.
    template<typename P>
    impl::filter<impl::complement<P>> reject(P pred)
    {
        return { { std::move(pred) } };
    }

    /// @brief Forward first `n` inputs, signaling stop on the `n`-th one.
    ///
    /// With `n == 0` the first input stops the reduction without being forwarded.
    inline impl::take take(size_t n)
    {
        return { n };
    }

    /// @brief Forward inputs until pred evaluates to false, then stop.
    template<typename P>
    impl::take_while<P> take_while(P pred)
    {
        return { std::move(pred) };
    }

    /// @brief Skip first `n` inputs.
    inline impl::drop drop(size_t n)
    {
        return { n };
    }

    /// @brief Skip inputs while pred evaluates to true.
    ///
    /// Once an input fails pred, this and all subsequent inputs are
    /// forwarded, and pred is not invoked again.
    template<typename P>
    impl::drop_while<P> drop_while(P pred)
    {
        return { std::move(pred) };
    }

    /// @}
    /// @defgroup uniq Uniquefying
    /// @{

    /// @brief Skip inputs equal to the previously forwarded one (consecutive dedup).
    ///
    /// NB: unlike `unique_by`, this does not remove non-adjacent repeats.
    /*!
    @code
        auto res = td::to_vector(td::unique(), vec_t{{ 1, 1, 2, 2, 3, 3, 2, 1 }});
        VERIFY(( res == vec_t{{ 1, 2, 3, 2, 1 }} ));
    @endcode
    */
    inline impl::unique_adjacent_by<by::identity> unique()
    {
        return { by::identity{} };
    }

    /// @brief Skip inputs having the same key as the previously forwarded one.
    template<typename F>
    impl::unique_adjacent_by<F> unique_adjacent_by(F key_fn)
    {
        return { std::move(key_fn) };
    }

    /// @brief Global dedup: forward the first input for every distinct key.
    ///
    /// Keys are kept in a `std::set`, so key_t must be less-than comparable,
    /// and the value returned by key_fn must have lifetime independent of the arg.
    template<typename F>
    impl::unique_by<F> unique_by(F key_fn)
    {
        return { std::move(key_fn) };
    }

    /// @}
    /// @defgroup grouping Grouping
    /// @{

    /// @brief Forward inputs in `std::vector`s of `chunk_size`.
    ///
    /// The trailing partial chunk is discarded.
    inline impl::chunk chunk(size_t chunk_size)
    {
        if(chunk_size < 1) {
            XDUCE_TD_THROW("Chunk size must be at least 1.");
        }
        return { chunk_size };
    }

    /// @brief Forward every full sliding window of `win_size` consecutive inputs.
    inline impl::aperture aperture(size_t win_size)
    {
        if(win_size < 1) {
            XDUCE_TD_THROW("Window size must be at least 1.");
        }
        return { win_size };
    }

    /// @}
    /// @defgroup logic Predicate Combinators
    /// @{

    template<typename P1, typename P2>
    impl::both<P1, P2> both(P1 pred1, P2 pred2)
    {
        return { std::move(pred1), std::move(pred2) };
    }

    template<typename P1, typename P2>
    impl::either<P1, P2> either(P1 pred1, P2 pred2)
    {
        return { std::move(pred1), std::move(pred2) };
    }

    template<typename P>
    impl::complement<P> complement(P pred)
    {
        return { std::move(pred) };
    }

    template<typename T>
    using predicates_t = std::vector<std::function<bool(const T&)>>;

    /// @brief True iff all predicates hold; true for an empty list.
    template<typename T>
    impl::all_pass<T> all_pass(predicates_t<T> preds)
    {
        return { std::move(preds) };
    }

    /// @brief True iff any predicate holds; false for an empty list.
    template<typename T>
    impl::any_pass<T> any_pass(predicates_t<T> preds)
    {
        return { std::move(preds) };
    }

    /// @}

} // namespace td

} // namespace xduce

#endif // #ifndef XDUCE_TD_HPP_


// The tests drive the transducers with the collectors, so they are
// compiled once collect.hpp is complete, whichever header comes first.
// If collect.hpp is still being read here, its tail re-includes this file.
#if XDUCE_TD_ENABLE_RUN_TESTS
#ifndef XDUCE_COLLECT_HPP_
#include "collect.hpp"
#endif

#if defined(XDUCE_COLLECT_HPP_COMPLETE_) && !defined(XDUCE_TD_TESTS_DEFINED_)
#define XDUCE_TD_TESTS_DEFINED_

#include <algorithm>
#include <map>
#include <string>
#include <random>
#include <iostream>
#include <stdexcept>
#include <cstdint>

#ifndef VERIFY
#define VERIFY(expr) if(!(expr)) XDUCE_TD_THROW("Assertion failed: ( "#expr" ).");
#endif

namespace xduce
{
namespace td
{
namespace impl
{

// move-only non-default-constructible type wrapping an int.
// Used as the value_type in tests to verify that
// the transducers never copy their inputs.
struct X
{
    int value;

    X(int i) : value{ i }
    {}

               X(X&&) = default;
    X& operator=(X&&) = default;

               X(const X&) = delete;
    X& operator=(const X&) = delete;

    operator int&()
    {
        return value;
    }

    operator const int& () const
    {
        return value;
    }
};
using Xs = std::vector<X>;
using vec_t = std::vector<int>;

// Drive src through xf, collecting the outputs as ints.
template<typename Xf, typename Iterable>
vec_t ints_of(const Xf& xf, Iterable&& src)
{
    return td::reduce(xf, std::forward<Iterable>(src), vec_t{}, [](vec_t out, int in)
    {
        out.push_back(in);
        return td::cont(std::move(out));
    });
}

// This is templated to unary-callable, because
// we want to reuse the same battery of tests when
// the elements are moved out of a container of X's,
// and when they are copied out of a long-lived vector of ints.
template<typename UnaryCallable>
auto make_tests(UnaryCallable make_inputs) -> std::map<std::string, std::function<void()>>
{
    std::map<std::string, std::function<void()>> tests{};

    // folds the outputs into a decimal number, e.g. [1,2,3] -> 123
    auto fold = [](int64_t out, int in)
    {
        return td::cont(out * 10 + in);
    };

    /////////////////////////////////////////////////////////////////////////

    tests["identity"] = [=]
    {
        VERIFY(td::reduce(td::identity(), make_inputs({1,2,3}), int64_t(0), fold) == 123);
        VERIFY(td::reduce(td::identity(), make_inputs({}),      int64_t(0), fold) == 0);
    };

    tests["map"] = [=]
    {
        auto res = ints_of(td::map([](int x) { return x * 2; }), make_inputs({1,2,3}));
        VERIFY(( res == vec_t{{ 2, 4, 6 }} ));

        // output type differs from input type
        auto res2 = td::reduce(
            td::map([](int x) { return std::to_string(x); }),
            make_inputs({1,2,3}),
            std::string{},
            [](std::string out, std::string in)
            {
                return td::cont(std::move(out) + "," + in);
            });
        VERIFY(res2 == ",1,2,3");
    };

    tests["filter"] = [=]
    {
        VERIFY(td::reduce(td::filter([](int x) { return x != 2; }), make_inputs({1,2,3}), int64_t(0), fold) == 13);
        VERIFY(td::reduce(td::filter([](int)   { return false;  }), make_inputs({1,2,3}), int64_t(0), fold) == 0);
        VERIFY(td::reduce(td::reject([](int x) { return x != 2; }), make_inputs({1,2,3}), int64_t(0), fold) == 2);

        // a stateful predicate: every other input
        auto every_other = [n = 0](const int&) mutable { return n++ % 2 == 0; };
        VERIFY(td::reduce(td::filter(every_other), make_inputs({1,2,3,4}), int64_t(0), fold) == 13);
        VERIFY(td::reduce(td::reject(every_other), make_inputs({1,2,3,4}), int64_t(0), fold) == 24);
    };

    tests["take"] = [=]
    {
        VERIFY(td::reduce(td::take(0),  make_inputs({1,2,3}), int64_t(0), fold) == 0);
        VERIFY(td::reduce(td::take(2),  make_inputs({1,2,3}), int64_t(0), fold) == 12);
        VERIFY(td::reduce(td::take(3),  make_inputs({1,2,3}), int64_t(0), fold) == 123);
        VERIFY(td::reduce(td::take(10), make_inputs({1,2,3}), int64_t(0), fold) == 123);
        VERIFY(td::reduce(td::take(10), make_inputs({}),      int64_t(0), fold) == 0);
    };

    tests["take_while"] = [=]
    {
        auto pred = [](int x) { return x < 3; };
        VERIFY(td::reduce(td::take_while(pred), make_inputs({1,2,3,1}), int64_t(0), fold) == 12);
        VERIFY(td::reduce(td::take_while(pred), make_inputs({3,1,2}),   int64_t(0), fold) == 0);
        VERIFY(td::reduce(td::take_while(pred), make_inputs({1,2}),     int64_t(0), fold) == 12);
    };

    tests["drop"] = [=]
    {
        VERIFY(td::reduce(td::drop(0),  make_inputs({1,2,3}), int64_t(0), fold) == 123);
        VERIFY(td::reduce(td::drop(2),  make_inputs({1,2,3}), int64_t(0), fold) == 3);
        VERIFY(td::reduce(td::drop(10), make_inputs({1,2,3}), int64_t(0), fold) == 0);
    };

    tests["drop_while"] = [=]
    {
        size_t num_calls = 0;
        auto xf = td::drop_while([&num_calls](int x)
        {
            ++num_calls;
            return x < 3;
        });

        VERIFY(td::reduce(xf, make_inputs({1,2,3,1,2}), int64_t(0), fold) == 312);
        VERIFY(num_calls == 3); // pred is not consulted once the latch flips

        VERIFY(td::reduce(xf, make_inputs({1,2}), int64_t(0), fold) == 0);
    };

    tests["unique_by"] = [=]
    {
        auto res = ints_of(td::unique_by([](int x) { return x % 3; }), make_inputs({1,4,2,3,5,6,7}));
        VERIFY(( res == vec_t{{ 1, 2, 3 }} ));
    };

    tests["scan"] = [=]
    {
        auto res = ints_of(td::scan(0L, [](long acc, int x) { return acc * 10 + x; }), make_inputs({1,2,3}));
        VERIFY(( res == vec_t{{ 1, 12, 123 }} ));
    };

    tests["tap"] = [=]
    {
        int64_t seen = 0;
        auto res = ints_of(td::tap([&seen](int x) { seen = seen * 10 + x; }), make_inputs({1,2,3}));
        VERIFY(( res == vec_t{{ 1, 2, 3 }} ));
        VERIFY(seen == 123);
    };

    tests["flat_map"] = [=]
    {
        auto expand = td::flat_map([](int x) { return vec_t(size_t(x), x); });

        VERIFY(td::reduce(expand, make_inputs({1,2,3}), int64_t(0), fold) == 122333);
        VERIFY(td::reduce(expand, make_inputs({0,1}),   int64_t(0), fold) == 1);

        // stop mid-expansion: the rest of the sub-sequence is discarded
        size_t num_forwarded = 0;
        auto res = ints_of(
            td::compose(expand,
                        td::tap([&num_forwarded](int) { ++num_forwarded; }),
                        td::take(4)),
            make_inputs({1,2,3,4}));

        VERIFY(( res == vec_t{{ 1, 2, 2, 3 }} ));
        VERIFY(num_forwarded == 4);
    };

    tests["chunk"] = [=]
    {
        auto res = td::reduce(td::chunk(2), make_inputs({1,2,3,4,5}), vec_t{}, [](vec_t out, auto chunk)
        {
            VERIFY(chunk.size() == 2);
            out.push_back(int(chunk[0]) * 10 + int(chunk[1]));
            return td::cont(std::move(out));
        });
        VERIFY(( res == vec_t{{ 12, 34 }} )); // partial trailing chunk is discarded

        VERIFY(td::count(td::chunk(3), make_inputs({1,2})) == 0);
    };

    tests["if_else"] = [=]
    {
        auto is_even = [](int x) { return x % 2 == 0; };
        auto times10 = [](int x) { return x * 10; };

        VERIFY(( ints_of(td::when(is_even, times10),   make_inputs({1,2,3})) == vec_t{{ 1, 20, 3 }} ));
        VERIFY(( ints_of(td::unless(is_even, times10), make_inputs({1,2,3})) == vec_t{{ 10, 2, 30 }} ));
        VERIFY(( ints_of(td::if_else(is_even, times10, [](int x) { return -x; }),
                         make_inputs({1,2,3})) == vec_t{{ -1, 20, -3 }} ));
    };

    tests["compose"] = [=]
    {
        const auto xf = td::compose(
            td::map([](int x) { return x * 2; }),
            td::filter([](int x) { return x % 3 == 0; }),
            td::drop(1),
            td::take(2));

        // 2,4,..,20 -> 6,12,18 -> 12,18
        VERIFY(( ints_of(xf, make_inputs({1,2,3,4,5,6,7,8,9,10})) == vec_t{{ 12, 18 }} ));
        VERIFY(td::reduce(xf, make_inputs({1,2,3,4,5,6,7,8,9,10}), int64_t(0), fold) == 138);

        // identity on either side
        VERIFY(td::reduce(td::compose(td::identity(), xf), make_inputs({1,2,3,4,5,6,7,8,9,10}), int64_t(0), fold) == 138);
        VERIFY(td::reduce(td::compose(xf, td::identity()), make_inputs({1,2,3,4,5,6,7,8,9,10}), int64_t(0), fold) == 138);
    };

    tests["reuse"] = [=]
    {
        // per-run state lives in the driver, not in the transducer
        const auto xf = td::compose(td::drop(1), td::take(2));
        VERIFY(td::reduce(xf, make_inputs({1,2,3,4}), int64_t(0), fold) == 23);
        VERIFY(td::reduce(xf, make_inputs({1,2,3,4}), int64_t(0), fold) == 23);
    };

    return tests;
}

static void run_tests()
{
    std::map<std::string, std::function<void()>>
        test_moved{}, test_copied{}, test_other{};

    // make battery of tests where the elements are moved out of an Xs
    test_moved = make_tests([](std::initializer_list<int> xs)
    {
        Xs ret;
        for(auto x : xs) {
            ret.push_back(X(x));
        }
        return ret;
    });

    // make battery of tests where the elements are copied out of a vector
    // that outlives the drive; will keep the underlying data in a static deque.
    test_copied = make_tests([](std::initializer_list<int> xs) -> const vec_t&
    {
        static std::deque<vec_t> vecs{};
        vecs.emplace_back(xs);
        return vecs.back();
    });

    // sequences for verifying the laws: the empty one, a few
    // hand-picked ones, and some random ones with a fixed seed.
    const auto seqs = []
    {
        std::vector<vec_t> ret{ vec_t{}, vec_t{{ 1 }}, vec_t{{ 1, 1, 2, 2, 3, 3, 2, 1 }} };

        std::mt19937 gen(42);
        std::uniform_int_distribution<int> len_dist(0, 30);
        std::uniform_int_distribution<int> val_dist(-5, 5);

        for(size_t i = 0; i < 50; i++) {
            vec_t seq(size_t(len_dist(gen)));
            for(auto& x : seq) {
                x = val_dist(gen);
            }
            ret.push_back(std::move(seq));
        }
        return ret;
    }();

    /////////////////////////////////////////////////////////////////////////

    test_other["step"] = [&]
    {
        VERIFY(td::cont(1).is_continue());
        VERIFY(td::stop(1).is_stop());
        VERIFY(td::stop(1) != td::cont(1));
        VERIFY(td::stop(42).unwrap() == 42);

        VERIFY(td::cont(2).map([](int x) { return x * 3; }) == td::cont(6));
        VERIFY(td::stop(2).map([](int x) { return x * 3; }) == td::stop(6));

        VERIFY(*td::cont(5).continue_value() == 5);
        VERIFY(!td::stop(5).continue_value());

        // stop short-circuits bind, converting the payload
        auto to_long = [](int x) { return td::cont(long(x) * 100); };
        VERIFY(td::stop(3).bind(to_long) == td::stop(3L));
        VERIFY(td::cont(3).bind(to_long) == td::cont(300L));

        // on a const lvalue the payload is left in place
        const auto s = td::stop(std::string("abc"));
        VERIFY(s.map([](const std::string& x) { return x.size(); }) == td::stop(size_t(3)));
        VERIFY(s.bind([](const std::string& x) { return td::cont(x + "d"); }) == td::stop(std::string("abc")));
        VERIFY(s.unwrap() == "abc");
    };

    test_other["step monad laws"] = [&]
    {
        auto f = [](int x) { return x % 2 ? td::stop(x * 2) : td::cont(x * 2); };
        auto g = [](int x) { return td::cont(x + 10); };
        auto unit = [](int x) { return td::cont(x); };

        for(int x : { -3, 0, 1, 2, 42 }) {
            for(auto m : { td::cont(x), td::stop(x) }) {
                VERIFY(td::cont(x).bind(f) == f(x));                    // left identity
                VERIFY(m.bind(unit) == m);                              // right identity
                VERIFY(m.bind(f).bind(g) == m.bind([&](int y) { return f(y).bind(g); }));
            }
        }
    };

    test_other["apply"] = [&]
    {
        // drive a reducing function by hand
        auto xrf = td::apply<int>(
            td::compose(td::map([](int x) { return x * 2; }), td::take(2)),
            [](int acc, int x)
            {
                return td::cont(acc + x);
            });

        auto s1 = xrf(0, 1);
        VERIFY(s1 == td::cont(2));

        auto s2 = xrf(s1.unwrap(), 5);
        VERIFY(s2 == td::stop(12)); // stops on the 2nd forward
    };

    test_other["maybe"] = [&]
    {
        td::maybe<std::string> m{};
        VERIFY(!m);
        VERIFY(m.value_or("dflt") == "dflt");

        m.reset("abc");
        VERIFY(m && *m == "abc" && m->size() == 3);

        auto m2 = m;
        VERIFY(m2 == m);

        m.reset();
        VERIFY(m != m2);
        VERIFY(m == td::maybe<std::string>{});
    };

    test_other["unique"] = [&]
    {
        auto res = td::to_vector(td::unique(), vec_t{{ 1, 1, 2, 2, 3, 3, 2, 1 }});
        VERIFY(( res == vec_t{{ 1, 2, 3, 2, 1 }} ));

        // compares keys with the previously forwarded element
        auto res2 = td::to_vector(td::unique_adjacent_by([](int x) { return x / 10; }),
                                  vec_t{{ 1, 5, 12, 17, 3, 31 }});
        VERIFY(( res2 == vec_t{{ 1, 12, 3, 31 }} ));

        // unlike unique_by, non-adjacent repeats are kept
        auto res3 = td::to_vector(td::unique_by(by::identity{}), vec_t{{ 1, 1, 2, 2, 3, 3, 2, 1 }});
        VERIFY(( res3 == vec_t{{ 1, 2, 3 }} ));
    };

    test_other["interpose"] = [&]
    {
        VERIFY(( td::to_vector(td::interpose(0), vec_t{{ 1, 2, 3 }}) == vec_t{{ 1, 0, 2, 0, 3 }} ));
        VERIFY(( td::to_vector(td::interpose(0), vec_t{{ 1 }})       == vec_t{{ 1 }} ));
        VERIFY(( td::to_vector(td::interpose(0), vec_t{})            == vec_t{} ));

        // stop between the separator and the element
        VERIFY(( td::to_vector(td::compose(td::interpose(0), td::take(2)), vec_t{{ 1, 2, 3 }}) == vec_t{{ 1, 0 }} ));

        auto res = td::to_vector(td::interpose(std::string(", ")),
                                 std::vector<std::string>{ "a", "b" });
        VERIFY(( res == std::vector<std::string>{ "a", ", ", "b" } ));
    };

    test_other["repeat_each"] = [&]
    {
        VERIFY(( td::to_vector(td::repeat_each(2), vec_t{{ 1, 2 }}) == vec_t{{ 1, 1, 2, 2 }} ));
        VERIFY(( td::to_vector(td::repeat_each(0), vec_t{{ 1, 2 }}) == vec_t{} ));
        VERIFY(( td::to_vector(td::compose(td::repeat_each(3), td::take(4)), vec_t{{ 1, 2 }}) == vec_t{{ 1, 1, 1, 2 }} ));
    };

    test_other["aperture"] = [&]
    {
        auto res = td::to_vector(td::aperture(3), vec_t{{ 1, 2, 3, 4, 5 }});
        VERIFY(( res == std::vector<vec_t>{ vec_t{{ 1, 2, 3 }}, vec_t{{ 2, 3, 4 }}, vec_t{{ 3, 4, 5 }} } ));

        VERIFY(td::to_vector(td::aperture(3), vec_t{{ 1, 2 }}).empty());
        VERIFY(td::to_vector(td::aperture(1), vec_t{{ 1, 2 }}).size() == 2);
    };

    test_other["chunk"] = [&]
    {
        auto res = td::to_vector(td::chunk(2), vec_t{{ 1, 2, 3, 4, 5, 6 }});
        VERIFY(( res == std::vector<vec_t>{ vec_t{{ 1, 2 }}, vec_t{{ 3, 4 }}, vec_t{{ 5, 6 }} } ));
    };

    test_other["invalid size"] = [&]
    {
        bool threw = false;
        try {
            auto xf = td::chunk(0);
            (void)xf;
        } catch(const std::logic_error&) {
            threw = true;
        }
        VERIFY(threw);

        threw = false;
        try {
            auto xf = td::aperture(0);
            (void)xf;
        } catch(const std::logic_error&) {
            threw = true;
        }
        VERIFY(threw);
    };

    test_other["exceptions propagate"] = [&]
    {
        size_t num_seen = 0;
        auto xf = td::compose(
            td::map([](int x)
            {
                if(x == 3) {
                    throw std::runtime_error("bad input");
                }
                return x;
            }),
            td::tap([&num_seen](int) { ++num_seen; }));

        bool threw = false;
        try {
            td::to_vector(xf, vec_t{{ 1, 2, 3, 4 }});
        } catch(const std::runtime_error& e) {
            threw = std::string(e.what()) == "bad input";
        }
        VERIFY(threw);
        VERIFY(num_seen == 2);
    };

    test_other["predicate combinators"] = [&]
    {
        auto is_even = [](int x) { return x % 2 == 0; };
        auto is_pos  = [](int x) { return x > 0; };

        VERIFY( td::both(is_even, is_pos)(2));
        VERIFY(!td::both(is_even, is_pos)(-2));
        VERIFY( td::either(is_even, is_pos)(-2));
        VERIFY(!td::either(is_even, is_pos)(-1));
        VERIFY( td::complement(is_even)(1));

        VERIFY( td::all_pass<int>({ is_even, is_pos })(4));
        VERIFY(!td::all_pass<int>({ is_even, is_pos })(3));
        VERIFY( td::any_pass<int>({ is_even, is_pos })(3));
        VERIFY(!td::any_pass<int>({ is_even, is_pos })(-3));

        VERIFY( td::all_pass<int>({})(0));
        VERIFY(!td::any_pass<int>({})(0));

        auto res = td::to_vector(td::filter(td::both(is_even, is_pos)), vec_t{{ -2, -1, 0, 1, 2, 3, 4 }});
        VERIFY(( res == vec_t{{ 2, 4 }} ));
    };

    /////////////////////////////////////////////////////////////////////////

    // drive two transducers over every sequence; outputs must agree
    auto verify_same = [&](const auto& xf1, const auto& xf2)
    {
        for(const auto& seq : seqs) {
            VERIFY(td::to_vector(xf1, seq) == td::to_vector(xf2, seq));
        }
    };

    test_other["associativity"] = [&]
    {
        auto a = td::map([](int x) { return x * 3; });
        auto b = td::filter([](int x) { return x % 2 != 0; });
        auto c = td::take(5);

        verify_same(td::compose(td::compose(a, b), c), td::compose(a, td::compose(b, c)));

        auto d = td::unique();
        auto e = td::scan(0, [](int acc, int x) { return acc + x; });
        auto f = td::drop_while([](int x) { return x < 0; });

        verify_same(td::compose(td::compose(d, e), f), td::compose(d, td::compose(e, f)));
        verify_same(td::compose(d, e, f), td::compose(d, td::compose(e, f)));
    };

    test_other["identity laws"] = [&]
    {
        auto t = td::compose(td::take_while([](int x) { return x != 0; }), td::unique());

        verify_same(td::compose(td::identity(), t), t);
        verify_same(td::compose(t, td::identity()), t);

        for(const auto& seq : seqs) {
            VERIFY(td::to_vector(td::identity(), seq) == seq);
        }
    };

    test_other["fusion laws"] = [&]
    {
        auto f = [](int x) { return x + 1; };
        auto g = [](int x) { return x * 2; };
        verify_same(td::compose(td::map(f), td::map(g)),
                    td::map([&](int x) { return g(f(x)); }));

        auto p = [](int x) { return x > -2; };
        auto q = [](int x) { return x % 3 != 0; };
        verify_same(td::compose(td::filter(p), td::filter(q)),
                    td::filter([&](int x) { return p(x) && q(x); }));
    };

    test_other["take bound"] = [&]
    {
        for(const auto& seq : seqs) {
            for(size_t n : { 0, 1, 2, 5, 100 }) {
                const auto res = td::to_vector(td::take(n), seq);
                VERIFY(res.size() == std::min(n, seq.size()));
                VERIFY(std::equal(res.begin(), res.end(), seq.begin()));
            }
        }
    };

    test_other["drop/take"] = [&]
    {
        for(const auto& seq : seqs) {
            for(size_t n : { 0, 1, 3, 40 }) {
                for(size_t m : { 0, 2, 7 }) {
                    const auto b = std::min(n, seq.size());
                    const auto e = std::min(n + m, seq.size());
                    VERIFY(td::to_vector(td::compose(td::drop(n), td::take(m)), seq)
                        == vec_t(seq.begin() + long(b), seq.begin() + long(e)));
                }
            }
        }
    };

    test_other["scan cumulative"] = [&]
    {
        auto f = [](int64_t acc, int x) { return acc * 3 + x; };

        for(const auto& seq : seqs) {
            const auto res = td::to_vector(td::scan(int64_t(7), f), seq);
            VERIFY(res.size() == seq.size());

            int64_t acc = 7;
            for(size_t i = 0; i < seq.size(); i++) {
                acc = f(acc, seq[i]);
                VERIFY(res[i] == acc);
            }
        }
    };

    test_other["unique adjacency"] = [&]
    {
        for(const auto& seq : seqs) {
            const auto res = td::to_vector(td::unique(), seq);
            VERIFY(std::adjacent_find(res.begin(), res.end()) == res.end());
            VERIFY(td::to_vector(td::unique_by(by::identity{}), res) == td::to_vector(td::unique_by(by::identity{}), seq));
        }
    };

    test_other["early termination"] = [&]
    {
        for(size_t n : { 1, 3, 5, 1000 }) {
            size_t num_calls = 0;
            const auto res = td::to_vector(
                td::compose(
                    td::map([&num_calls](int x)
                    {
                        ++num_calls;
                        return x;
                    }),
                    td::take(n)),
                td::range(1, 1000001));

            VERIFY(res.size() == n);
            VERIFY(num_calls == n);
        }
    };

    /////////////////////////////////////////////////////////////////////////

    test_other["map-filter-take"] = [&]
    {
        const auto xf = td::compose(
            td::map([](int x) { return x * 2; }),
            td::filter([](int x) { return x % 3 == 0; }),
            td::take(5));

        VERIFY(( td::to_vector(xf, td::range(1, 101)) == vec_t{{ 6, 12, 18, 24, 30 }} ));
    };

    test_other["take from large range"] = [&]
    {
        size_t num_pulled = 0;
        const auto xf = td::compose(
            td::tap([&num_pulled](int) { ++num_pulled; }),
            td::take(3));

        VERIFY(( td::to_vector(xf, td::range(1, 1000001)) == vec_t{{ 1, 2, 3 }} ));
        VERIFY(num_pulled == 3);
    };

    test_other["running sum"] = [&]
    {
        auto res = td::to_vector(
            td::scan(0, [](int out, int in) { return out + in; }),
            vec_t{{ 1, 2, 3, 4, 5 }});

        VERIFY(( res == vec_t{{ 1, 3, 6, 10, 15 }} ));
    };

    /////////////////////////////////////////////////////////////////////////
    size_t num_failed = 0;
    size_t num_ok = 0;
    for(auto&& tests : { test_moved, test_copied, test_other })
        for(const auto& kv : tests)
    {
        try{
            kv.second();
            num_ok++;
        } catch(const std::exception& e) {
            num_failed++;
            std::cerr << "Failed test '" << kv.first << "' :" << e.what() << "\n";
        }
    }
    if(num_failed == 0) {
        std::cerr << "Ran " << num_ok << " tests - OK\n";
    } else {
        throw std::runtime_error(std::to_string(num_failed) + " tests failed.");
    }
}

} // namespace impl
} // namespace td
} // namespace xduce

#endif // XDUCE_TD_TESTS_DEFINED_
#endif //XDUCE_TD_ENABLE_RUN_TESTS

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
#ifndef XDUCE_PIPELINE_HPP_
#define XDUCE_PIPELINE_HPP_

#include "collect.hpp"

#include <memory>
#include <functional>
#include <vector>

namespace xduce
{

namespace td
{

    /////////////////////////////////////////////////////////////////////////
    /// @brief A chain of same-type stages assembled at run-time.
    ///
    /// Unlike a chain built with `td::compose`, whose type encodes every stage,
    /// the stages of a pipeline are type-erased, so the chain can be
    /// built from a loop or a config, passed across non-template interfaces, etc.
    ///
    /// Every builder-method returns a new pipeline with the stage appended.
    /// The stage-closures are held by shared_ptr, so copies of a pipeline
    /// share them; the per-run counters and latches live in the reducing
    /// function built by `apply`, as with the statically-composed transducers.
    ///
    /// A pipeline is itself a transducer, so it may be composed with others
    /// or driven by any collector. Exceptions thrown by the stage-closures
    /// propagate to the caller.
    /*!
    @code
        const auto p = td::pipeline<int>{}
            .map([](int x) { return x * 2; })
            .filter([](int x) { return x % 3 == 0; })
            .take(5);

        VERIFY(( p.to_vector(td::range(1, 101)) == vec_t{{ 6, 12, 18, 24, 30 }} ));
        VERIFY(( p.reduce(td::range(1, 101), 0, [](int acc, int x) { return acc + x; }) == 90 ));
    @endcode
    */
    template<typename T>
    class pipeline
    {
    public:
        using value_type = T;

        template<typename In>
        using output = T;

        using        map_fn_t = std::function<T(T)>;
        using          pred_t = std::function<bool(const T&)>;
        using        tap_fn_t = std::function<void(const T&)>;
        using   flat_map_fn_t = std::function<std::vector<T>(T)>;

    private:
        enum class kind
        {
            map,
            filter,
            take,
            take_while,
            drop,
            drop_while,
            tap,
            flat_map
        };

        // only the field(s) relevant to the kind are set
        struct stage
        {
            kind k;
            size_t n;
            std::shared_ptr<const map_fn_t> map_fn;
            std::shared_ptr<const pred_t> pred;
            std::shared_ptr<const tap_fn_t> tap_fn;
            std::shared_ptr<const flat_map_fn_t> flat_map_fn;
        };

    public:

        /// Forward `fn(x)`; `fn` must return a value convertible to T.
        template<typename F>
        pipeline map(F fn) const
        {
            auto st = make_stage(kind::map);
            st.map_fn = std::make_shared<map_fn_t>(std::move(fn));
            return append(std::move(st));
        }

        template<typename P>
        pipeline filter(P pred) const
        {
            auto st = make_stage(kind::filter);
            st.pred = std::make_shared<pred_t>(std::move(pred));
            return append(std::move(st));
        }

        pipeline take(size_t n) const
        {
            auto st = make_stage(kind::take);
            st.n = n;
            return append(std::move(st));
        }

        template<typename P>
        pipeline take_while(P pred) const
        {
            auto st = make_stage(kind::take_while);
            st.pred = std::make_shared<pred_t>(std::move(pred));
            return append(std::move(st));
        }

        pipeline drop(size_t n) const
        {
            auto st = make_stage(kind::drop);
            st.n = n;
            return append(std::move(st));
        }

        template<typename P>
        pipeline drop_while(P pred) const
        {
            auto st = make_stage(kind::drop_while);
            st.pred = std::make_shared<pred_t>(std::move(pred));
            return append(std::move(st));
        }

        template<typename F>
        pipeline tap(F fn) const
        {
            auto st = make_stage(kind::tap);
            st.tap_fn = std::make_shared<tap_fn_t>(std::move(fn));
            return append(std::move(st));
        }

        /// `fn(x)` may return any finite iterable of values convertible to T.
        template<typename F>
        pipeline flat_map(F fn) const
        {
            auto st = make_stage(kind::flat_map);
            st.flat_map_fn = std::make_shared<flat_map_fn_t>([fn](T x) mutable
            {
                auto subseq = fn(std::move(x));
                return std::vector<T>(std::begin(subseq), std::end(subseq));
            });
            return append(std::move(st));
        }

        size_t size() const
        {
            return m_stages.size();
        }

        /////////////////////////////////////////////////////////////////////
        template<typename In, typename Rf>
        struct rf
        {
                           Rf next;
               std::vector<stage> stages;
              std::vector<size_t> counts;  // take, drop: number of inputs seen so far
                std::vector<char> latched; // drop_while: found an unsatisfying input

            template<typename Acc>
            step<Acc> operator()(Acc acc, In x)
            {
                return push(std::move(acc), T(std::move(x)), 0);
            }

            // Feed x to the stages [i, end), and then to next.
            template<typename Acc>
            step<Acc> push(Acc acc, T x, size_t i)
            {
                for(; i < stages.size(); i++) {
                    const stage& st = stages[i];

                    switch(st.k) {
                    case kind::map:
                        x = (*st.map_fn)(std::move(x));
                        break;

                    case kind::filter:
                        if(!(*st.pred)(x)) {
                            return td::cont(std::move(acc));
                        }
                        break;

                    case kind::take:
                    {
                        if(counts[i] >= st.n) {
                            return td::stop(std::move(acc));
                        }
                        ++counts[i];
                        auto ret = push(std::move(acc), std::move(x), i + 1);

                        if(counts[i] >= st.n) {
                            return td::stop(std::move(ret).unwrap());
                        }
                        return ret;
                    }

                    case kind::take_while:
                        if(!(*st.pred)(x)) {
                            return td::stop(std::move(acc));
                        }
                        break;

                    case kind::drop:
                        if(counts[i] < st.n) {
                            ++counts[i];
                            return td::cont(std::move(acc));
                        }
                        break;

                    case kind::drop_while:
                        if(!latched[i] && (*st.pred)(x)) {
                            return td::cont(std::move(acc));
                        }
                        latched[i] = 1;
                        break;

                    case kind::tap:
                        (*st.tap_fn)(x);
                        break;

                    case kind::flat_map:
                    {
                        auto subseq = (*st.flat_map_fn)(std::move(x));

                        for(auto& y : subseq) {
                            auto ret = push(std::move(acc), std::move(y), i + 1);

                            if(ret.is_stop()) {
                                return ret;
                            }
                            acc = std::move(ret).unwrap();
                        }
                        return td::cont(std::move(acc));
                    }
                    }
                }
                return next(std::move(acc), std::move(x));
            }
        };

        template<typename In, typename Rf>
        rf<In, Rf> apply(Rf next) const
        {
            return { std::move(next),
                     m_stages,
                     std::vector<size_t>(m_stages.size(), 0),
                     std::vector<char>(m_stages.size(), 0) };
        }

        /////////////////////////////////////////////////////////////////////
        /// @brief Collect the outputs in order.
        template<typename Iterable>
        std::vector<T> to_vector(Iterable&& src) const
        {
            return td::to_vector(*this, std::forward<Iterable>(src));
        }

        /// @brief Left-fold the outputs with `fold_op(Acc, T) -> Acc`.
        ///
        /// The fold-op cannot stop the reduction; early termination
        /// comes only from the take and take_while stages.
        template<typename Iterable, typename Acc, typename F>
        Acc reduce(Iterable&& src, Acc init, F fold_op) const
        {
            return td::reduce(*this, std::forward<Iterable>(src), std::move(init),
                [fold_op](Acc acc, T x) mutable
                {
                    return td::cont(Acc(fold_op(std::move(acc), std::move(x))));
                });
        }

    private:
        static stage make_stage(kind k)
        {
            return { k, 0, nullptr, nullptr, nullptr, nullptr };
        }

        pipeline append(stage st) const
        {
            pipeline ret = *this;
            ret.m_stages.push_back(std::move(st));
            return ret;
        }

        std::vector<stage> m_stages;
    };

} // namespace td

} // namespace xduce


#if XDUCE_PIPELINE_ENABLE_RUN_TESTS
#include <map>
#include <string>
#include <iostream>
#include <stdexcept>

#ifndef VERIFY
#define VERIFY(expr) if(!(expr)) XDUCE_TD_THROW("Assertion failed: ( "#expr" ).");
#endif

namespace xduce
{
namespace td
{
namespace impl
{
namespace pipeline_tests
{

static void run_tests()
{
    using vec_t = std::vector<int>;
    using p_t = td::pipeline<int>;

    std::map<std::string, std::function<void()>> tests{};

    const auto times2  = [](int x) { return x * 2; };
    const auto by3     = [](int x) { return x % 3 == 0; };
    const auto is_small = [](int x) { return x < 10; };

    /////////////////////////////////////////////////////////////////////////

    tests["empty pipeline"] = [&]
    {
        VERIFY(p_t{}.size() == 0);
        VERIFY(( p_t{}.to_vector(vec_t{{ 1, 2, 3 }}) == vec_t{{ 1, 2, 3 }} ));
        VERIFY(p_t{}.to_vector(vec_t{}).empty());
    };

    tests["map-filter-take"] = [&]
    {
        const auto p = p_t{}.map(times2).filter(by3).take(5);
        VERIFY(p.size() == 3);

        VERIFY(( p.to_vector(td::range(1, 101)) == vec_t{{ 6, 12, 18, 24, 30 }} ));
        VERIFY(p.reduce(td::range(1, 101), 0, [](int acc, int x) { return acc + x; }) == 90);
    };

    tests["builder is persistent"] = [&]
    {
        const auto p1 = p_t{}.map(times2);
        const auto p2 = p1.take(1);
        const auto p3 = p1.drop(1);

        VERIFY(p1.size() == 1);
        VERIFY(( p1.to_vector(vec_t{{ 1, 2, 3 }}) == vec_t{{ 2, 4, 6 }} ));
        VERIFY(( p2.to_vector(vec_t{{ 1, 2, 3 }}) == vec_t{{ 2 }} ));
        VERIFY(( p3.to_vector(vec_t{{ 1, 2, 3 }}) == vec_t{{ 4, 6 }} ));
    };

    tests["reuse"] = [&]
    {
        // counters and latches are per-run
        const auto p = p_t{}.drop_while(is_small).drop(1).take(2);
        const vec_t src{{ 1, 20, 30, 5, 40, 50 }};

        VERIFY(( p.to_vector(src) == vec_t{{ 30, 5 }} ));
        VERIFY(( p.to_vector(src) == vec_t{{ 30, 5 }} ));
    };

    tests["take_while"] = [&]
    {
        const auto p = p_t{}.take_while(is_small);
        VERIFY(( p.to_vector(vec_t{{ 1, 2, 30, 4 }}) == vec_t{{ 1, 2 }} ));
    };

    tests["flat_map"] = [&]
    {
        const auto p = p_t{}
            .flat_map([](int x) { return vec_t(size_t(x), x); })
            .take(4);

        VERIFY(( p.to_vector(vec_t{{ 1, 2, 3, 4 }}) == vec_t{{ 1, 2, 2, 3 }} ));

        // sub-sequence may be any iterable
        const auto p2 = p_t{}.flat_map([](int x) { return td::range(0, x); });
        VERIFY(( p2.to_vector(vec_t{{ 1, 3 }}) == vec_t{{ 0, 0, 1, 2 }} ));
    };

    tests["one call per stage per element"] = [&]
    {
        std::map<std::string, size_t> num_calls{};

        const auto p = p_t{}
            .map([&](int x)         { num_calls["map"]++;    return x + 1; })
            .filter([&](int x)      { num_calls["filter"]++; return x % 2 == 0; })
            .tap([&](int)           { num_calls["tap"]++; })
            .take(3);

        VERIFY(( p.to_vector(td::range(0, 1000000)) == vec_t{{ 2, 4, 6 }} ));

        // the 6th source element (5) produces the 3rd output; nothing is pulled after it
        VERIFY(num_calls["map"] == 6);
        VERIFY(num_calls["filter"] == 6);
        VERIFY(num_calls["tap"] == 3);
    };

    tests["same as composed"] = [&]
    {
        const auto p = p_t{}
            .drop_while(is_small)
            .map(times2)
            .filter(by3)
            .drop(1)
            .take(4);

        const auto xf = td::compose(
            td::drop_while(is_small),
            td::map(times2),
            td::filter(by3),
            td::drop(1),
            td::take(4));

        for(const auto& src : { vec_t{}, vec_t{{ 1, 2, 3 }}, vec_t{{ 12, 1, 15, 3, 30, 6, 9, 21, 33, 90 }} }) {
            VERIFY(p.to_vector(src) == td::to_vector(xf, src));
        }
    };

    tests["as a transducer"] = [&]
    {
        const auto xf = td::compose(p_t{}.map(times2), td::scan(0, [](int acc, int x) { return acc + x; }));
        VERIFY(( td::to_vector(xf, vec_t{{ 1, 2, 3 }}) == vec_t{{ 2, 6, 12 }} ));

        VERIFY(td::count(p_t{}.filter(by3), td::range(0, 30)) == 10);
    };

    tests["exceptions propagate"] = [&]
    {
        const auto p = p_t{}.map([](int x)
        {
            if(x == 2) {
                throw std::invalid_argument("bad input");
            }
            return x;
        });

        bool threw = false;
        try {
            p.to_vector(vec_t{{ 1, 2, 3 }});
        } catch(const std::invalid_argument&) {
            threw = true;
        }
        VERIFY(threw);
    };

    tests["strings"] = [&]
    {
        const auto p = td::pipeline<std::string>{}
            .filter([](const std::string& s) { return !s.empty(); })
            .map([](std::string s) { return s + "!"; });

        const auto res = p.reduce(std::vector<std::string>{ "a", "", "b" }, std::string{},
            [](std::string acc, std::string s)
            {
                return acc + s;
            });

        VERIFY(res == "a!b!");
    };

    /////////////////////////////////////////////////////////////////////////
    size_t num_failed = 0;
    size_t num_ok = 0;
    for(const auto& kv : tests) {
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

} // namespace pipeline_tests
} // namespace impl
} // namespace td
} // namespace xduce

#endif //XDUCE_PIPELINE_ENABLE_RUN_TESTS

#endif // #ifndef XDUCE_PIPELINE_HPP_

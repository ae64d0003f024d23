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
#ifndef XDUCE_COLLECT_HPP_
#define XDUCE_COLLECT_HPP_

#include "td.hpp"

#include <map>
#include <deque>
#include <vector>
#include <set>
#include <iterator>
#include <utility>
#include <type_traits>
#include <algorithm>
#include <random>
#include <cmath>

namespace xduce
{

namespace td
{

namespace impl
{
    /////////////////////////////////////////////////////////////////////////
    template<typename Iterable>
    using elem_t = typename std::decay<decltype(*std::begin(std::declval<Iterable&>()))>::type;

    // Elements of an rvalue source are moved into the chain;
    // elements of an lvalue source are copied.
    template<typename Iterable, typename T>
    auto forward_elem(T& x) -> typename std::conditional<
                                    std::is_lvalue_reference<Iterable>::value,
                                    const T&,
                                    T&&>::type
    {
        return static_cast<typename std::conditional<
                               std::is_lvalue_reference<Iterable>::value,
                               const T&,
                               T&&>::type>(x);
    }

    /////////////////////////////////////////////////////////////////////////
    /// Lazy half-open arithmetic progression [first, last).
    template<typename Int>
    class range
    {
    public:
        static_assert(std::is_integral<Int>::value, "range requires an integral type.");

        class iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using        value_type = Int;
            using   difference_type = std::ptrdiff_t;
            using           pointer = const Int*;
            using         reference = Int;

            iterator(Int cur, Int last, Int stride)
                : m_cur{ cur }, m_last{ last }, m_stride{ stride }
            {}

            Int operator*() const
            {
                return m_cur;
            }

            iterator& operator++()
            {
                if(at_end()) {
                    return *this;
                }

                // Clamp at m_last, so that we never overflow Int past the end.
                // The distance to m_last and the magnitude of the stride
                // are computed unsigned, as either may exceed max of Int.
                using uint_t = typename std::make_unsigned<Int>::type;

                const uint_t dist = m_stride > 0 ? uint_t(uint_t(m_last) - uint_t(m_cur))
                                                 : uint_t(uint_t(m_cur) - uint_t(m_last));

                const uint_t step_size = m_stride > 0 ? uint_t(m_stride)
                                                      : uint_t(uint_t(0) - uint_t(m_stride));

                m_cur = dist > step_size ? Int(m_cur + m_stride) : m_last;
                return *this;
            }

            iterator operator++(int)
            {
                auto ret = *this;
                ++*this;
                return ret;
            }

            bool at_end() const
            {
                return m_stride > 0 ? !(m_cur < m_last) : !(m_last < m_cur);
            }

            bool operator==(const iterator& other) const
            {
                return (at_end() && other.at_end())
                    || (!at_end() && !other.at_end() && m_cur == other.m_cur);
            }

            bool operator!=(const iterator& other) const
            {
                return !(*this == other);
            }

        private:
            Int m_cur;
            Int m_last;
            Int m_stride;
        };

        range(Int first, Int last, Int stride)
            : m_first{ first }, m_last{ last }, m_stride{ stride }
        {}

        iterator begin() const
        {
            return { m_first, m_last, m_stride };
        }

        iterator end() const
        {
            return { m_last, m_last, m_stride };
        }

    private:
        Int m_first;
        Int m_last;
        Int m_stride;
    };

}   // namespace impl

    /// @defgroup drive Driving
    /// @{

    /////////////////////////////////////////////////////////////////////////
    /// @brief Lazy integral sequence from `first` up to (not including) `last`.
    ///
    /// A negative `stride` counts down towards `last`.
    /*!
    @code
        VERIFY(( td::to_vector(td::identity(), td::range(1, 10, 3)) == vec_t{{ 1, 4, 7 }} ));
        VERIFY(( td::to_vector(td::identity(), td::range(5, 0, -2)) == vec_t{{ 5, 3, 1 }} ));
    @endcode
    */
    template<typename Int>
    impl::range<Int> range(Int first, Int last, Int stride)
    {
        if(stride == 0) {
            XDUCE_TD_THROW("Range stride must be nonzero.");
        }
        return { first, last, stride };
    }

    template<typename Int>
    impl::range<Int> range(Int first, Int last)
    {
        return { first, last, Int(1) };
    }

    /////////////////////////////////////////////////////////////////////////
    /// @brief Drive `src` through `xf` into the reducing function `rf`, starting from `init`.
    ///
    /// `rf` is a callable `(Acc, output_t<Xf, In>) -> step<Acc>`.
    /// The reduction halts as soon as a step signals stop: the
    /// accumulator from that step is returned, and no further source
    /// elements are pulled. Exceptions thrown by the user-supplied
    /// callables propagate to the caller.
    ///
    /// Every other collector is `reduce` with a specialized reducer and seed.
    template<typename Xf, typename Iterable, typename Acc, typename Rf>
    Acc reduce(const Xf& xf, Iterable&& src, Acc init, Rf rf)
    {
        using in_t = impl::elem_t<Iterable>;

        auto xrf = xf.template apply<in_t>(std::move(rf));
        Acc acc = std::move(init);

        for(auto it = std::begin(src), it_end = std::end(src); it != it_end; ++it) {
            auto&& x = *it;
            auto ret = xrf(std::move(acc), impl::forward_elem<Iterable>(x));

            const bool stopped = ret.is_stop();
            acc = std::move(ret).unwrap();

            if(stopped) {
                break; // not advancing: the next element is never pulled
            }
        }
        return acc;
    }

    /////////////////////////////////////////////////////////////////////////
    /// @brief Collect the forwarded outputs, in order.
    template<typename Xf, typename Iterable>
    auto to_vector(const Xf& xf, Iterable&& src) -> std::vector<output_t<Xf, impl::elem_t<Iterable>>>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;
        using vec_t = std::vector<out_t>;

        return td::reduce(xf, std::forward<Iterable>(src), vec_t{},
            [](vec_t acc, out_t x)
            {
                acc.push_back(std::move(x));
                return td::cont(std::move(acc));
            });
    }

    /// @}
    /// @defgroup fold Folding
    /// @{

    /// @brief Sum of the outputs, starting from a value-initialized zero.
    template<typename Xf, typename Iterable>
    auto sum(const Xf& xf, Iterable&& src) -> output_t<Xf, impl::elem_t<Iterable>>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;

        return td::reduce(xf, std::forward<Iterable>(src), out_t{},
            [](out_t acc, out_t x)
            {
                return td::cont(out_t(std::move(acc) + std::move(x)));
            });
    }

    /// @brief Product of the outputs, starting from one.
    template<typename Xf, typename Iterable>
    auto product(const Xf& xf, Iterable&& src) -> output_t<Xf, impl::elem_t<Iterable>>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;

        return td::reduce(xf, std::forward<Iterable>(src), out_t(1),
            [](out_t acc, out_t x)
            {
                return td::cont(out_t(std::move(acc) * std::move(x)));
            });
    }

    /// @brief Number of forwarded outputs.
    template<typename Xf, typename Iterable>
    size_t count(const Xf& xf, Iterable&& src)
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;

        return td::reduce(xf, std::forward<Iterable>(src), size_t(0),
            [](size_t acc, const out_t&)
            {
                return td::cont(acc + 1);
            });
    }

    /// @brief Ordered map of distinct outputs to their number of occurrences.
    template<typename Xf, typename Iterable>
    auto frequencies(const Xf& xf, Iterable&& src) -> std::map<output_t<Xf, impl::elem_t<Iterable>>, size_t>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;
        using map_t = std::map<out_t, size_t>;

        return td::reduce(xf, std::forward<Iterable>(src), map_t{},
            [](map_t acc, out_t x)
            {
                ++acc[std::move(x)];
                return td::cont(std::move(acc));
            });
    }

    /// @}
    /// @defgroup search Searching
    /// @{

    /// @brief First forwarded output, if any; stops on it.
    template<typename Xf, typename Iterable>
    auto first(const Xf& xf, Iterable&& src) -> maybe<output_t<Xf, impl::elem_t<Iterable>>>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;
        using ret_t = maybe<out_t>;

        return td::reduce(xf, std::forward<Iterable>(src), ret_t{},
            [](ret_t, out_t x)
            {
                return td::stop(ret_t{ std::move(x) });
            });
    }

    /// @brief Last forwarded output, if any.
    template<typename Xf, typename Iterable>
    auto last(const Xf& xf, Iterable&& src) -> maybe<output_t<Xf, impl::elem_t<Iterable>>>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;
        using ret_t = maybe<out_t>;

        return td::reduce(xf, std::forward<Iterable>(src), ret_t{},
            [](ret_t, out_t x)
            {
                return td::cont(ret_t{ std::move(x) });
            });
    }

    /// @brief First forwarded output satisfying `pred`, if any.
    template<typename Xf, typename Iterable, typename P>
    auto find(const Xf& xf, Iterable&& src, P pred) -> maybe<output_t<Xf, impl::elem_t<Iterable>>>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;
        using ret_t = maybe<out_t>;

        return td::reduce(xf, std::forward<Iterable>(src), ret_t{},
            [pred](ret_t acc, out_t x) mutable
            {
                if(pred(static_cast<const out_t&>(x))) {
                    return td::stop(ret_t{ std::move(x) });
                }
                return td::cont(std::move(acc));
            });
    }

    /// @brief True iff every output satisfies `pred`; true for an empty sequence.
    ///
    /// Stops on the first output failing `pred`.
    template<typename Xf, typename Iterable, typename P>
    bool every(const Xf& xf, Iterable&& src, P pred)
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;

        return td::reduce(xf, std::forward<Iterable>(src), true,
            [pred](bool acc, const out_t& x) mutable
            {
                return pred(x) ? td::cont(acc) : td::stop(false);
            });
    }

    /// @brief True iff some output satisfies `pred`; stops on the first one that does.
    template<typename Xf, typename Iterable, typename P>
    bool some(const Xf& xf, Iterable&& src, P pred)
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;

        return td::reduce(xf, std::forward<Iterable>(src), false,
            [pred](bool acc, const out_t& x) mutable
            {
                return pred(x) ? td::stop(true) : td::cont(acc);
            });
    }

    /// @brief True iff no output satisfies `pred`.
    template<typename Xf, typename Iterable, typename P>
    bool none(const Xf& xf, Iterable&& src, P pred)
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;

        return td::reduce(xf, std::forward<Iterable>(src), true,
            [pred](bool acc, const out_t& x) mutable
            {
                return pred(x) ? td::stop(false) : td::cont(acc);
            });
    }

    /// @brief True iff some output compares equal to `target`.
    template<typename Xf, typename Iterable, typename T>
    bool contains(const Xf& xf, Iterable&& src, const T& target)
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;

        return td::reduce(xf, std::forward<Iterable>(src), false,
            [&target](bool acc, const out_t& x)
            {
                return x == target ? td::stop(true) : td::cont(acc);
            });
    }

    /// @brief Output with the least key; the first one wins ties.
    template<typename Xf, typename Iterable, typename F>
    auto min_by(const Xf& xf, Iterable&& src, F key_fn) -> maybe<output_t<Xf, impl::elem_t<Iterable>>>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;
        using ret_t = maybe<out_t>;

        return td::reduce(xf, std::forward<Iterable>(src), ret_t{},
            [key_fn](ret_t acc, out_t x) mutable
            {
                if(!acc || key_fn(static_cast<const out_t&>(x)) < key_fn(static_cast<const out_t&>(*acc))) {
                    acc.reset(std::move(x));
                }
                return td::cont(std::move(acc));
            });
    }

    /// @brief Output with the greatest key; the first one wins ties.
    template<typename Xf, typename Iterable, typename F>
    auto max_by(const Xf& xf, Iterable&& src, F key_fn) -> maybe<output_t<Xf, impl::elem_t<Iterable>>>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;
        using ret_t = maybe<out_t>;

        return td::reduce(xf, std::forward<Iterable>(src), ret_t{},
            [key_fn](ret_t acc, out_t x) mutable
            {
                if(!acc || key_fn(static_cast<const out_t&>(*acc)) < key_fn(static_cast<const out_t&>(x))) {
                    acc.reset(std::move(x));
                }
                return td::cont(std::move(acc));
            });
    }

    template<typename Xf, typename Iterable>
    auto min(const Xf& xf, Iterable&& src) -> maybe<output_t<Xf, impl::elem_t<Iterable>>>
    {
        return td::min_by(xf, std::forward<Iterable>(src), by::identity{});
    }

    template<typename Xf, typename Iterable>
    auto max(const Xf& xf, Iterable&& src) -> maybe<output_t<Xf, impl::elem_t<Iterable>>>
    {
        return td::max_by(xf, std::forward<Iterable>(src), by::identity{});
    }

    /// @}
    /// @defgroup split Splitting
    /// @{

    /// @brief Route outputs into (passing, failing) by `pred`, preserving order.
    /*!
    @code
        auto res = td::partition(td::identity(), vec_t{{ 1, 2, 3, 4, 5 }},
                                 [](int x) { return x % 2 == 0; });

        VERIFY(( res.first  == vec_t{{ 2, 4 }} ));
        VERIFY(( res.second == vec_t{{ 1, 3, 5 }} ));
    @endcode
    */
    template<typename Xf, typename Iterable, typename P>
    auto partition(const Xf& xf, Iterable&& src, P pred)
        -> std::pair<std::vector<output_t<Xf, impl::elem_t<Iterable>>>,
                     std::vector<output_t<Xf, impl::elem_t<Iterable>>>>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;
        using ret_t = std::pair<std::vector<out_t>, std::vector<out_t>>;

        return td::reduce(xf, std::forward<Iterable>(src), ret_t{},
            [pred](ret_t acc, out_t x) mutable
            {
                auto& dest = pred(static_cast<const out_t&>(x)) ? acc.first : acc.second;
                dest.push_back(std::move(x));
                return td::cont(std::move(acc));
            });
    }

    /// @brief Ordered map of `key_fn(x)` to the outputs having that key, in arrival order.
    ///
    /// `key_fn` is invoked with a const-reference, and must return a value
    /// having lifetime independent of its argument.
    template<typename Xf, typename Iterable, typename F>
    auto group_by(const Xf& xf, Iterable&& src, F key_fn)
        -> std::map<impl::invoke_result_t<F, const output_t<Xf, impl::elem_t<Iterable>>&>,
                    std::vector<output_t<Xf, impl::elem_t<Iterable>>>>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;
        using key_t = impl::invoke_result_t<F, const out_t&>;
        using map_t = std::map<key_t, std::vector<out_t>>;

        return td::reduce(xf, std::forward<Iterable>(src), map_t{},
            [key_fn](map_t acc, out_t x) mutable
            {
                auto key = key_fn(static_cast<const out_t&>(x));
                acc[std::move(key)].push_back(std::move(x));
                return td::cont(std::move(acc));
            });
    }

    /// @brief Split outputs into runs of consecutive elements having equal `key_fn(x)`.
    template<typename Xf, typename Iterable, typename F>
    auto partition_by(const Xf& xf, Iterable&& src, F key_fn)
        -> std::vector<std::vector<output_t<Xf, impl::elem_t<Iterable>>>>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;
        using ret_t = std::vector<std::vector<out_t>>;

        return td::reduce(xf, std::forward<Iterable>(src), ret_t{},
            [key_fn](ret_t acc, out_t x) mutable
            {
                if(acc.empty() || !(   key_fn(static_cast<const out_t&>(acc.back().back()))
                                    == key_fn(static_cast<const out_t&>(x))))
                {
                    acc.emplace_back();
                }
                acc.back().push_back(std::move(x));
                return td::cont(std::move(acc));
            });
    }

    /// @brief Last `n` outputs, in order.
    template<typename Xf, typename Iterable>
    auto take_last(const Xf& xf, Iterable&& src, size_t n) -> std::vector<output_t<Xf, impl::elem_t<Iterable>>>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;
        using buf_t = std::deque<out_t>;

        auto buf = td::reduce(xf, std::forward<Iterable>(src), buf_t{},
            [n](buf_t acc, out_t x)
            {
                acc.push_back(std::move(x));
                if(acc.size() > n) {
                    acc.pop_front();
                }
                return td::cont(std::move(acc));
            });

        return std::vector<out_t>(std::make_move_iterator(buf.begin()),
                                  std::make_move_iterator(buf.end()));
    }

    /// @brief All but the last `n` outputs, in order.
    ///
    /// Outputs are held back in a buffer of `n`, and released
    /// as soon as it is known that they are not among the last `n`.
    template<typename Xf, typename Iterable>
    auto drop_last(const Xf& xf, Iterable&& src, size_t n) -> std::vector<output_t<Xf, impl::elem_t<Iterable>>>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;
        using acc_t = std::pair<std::deque<out_t>, std::vector<out_t>>; // (held back, released)

        return td::reduce(xf, std::forward<Iterable>(src), acc_t{},
            [n](acc_t acc, out_t x)
            {
                acc.first.push_back(std::move(x));
                if(acc.first.size() > n) {
                    acc.second.push_back(std::move(acc.first.front()));
                    acc.first.pop_front();
                }
                return td::cont(std::move(acc));
            }).second;
    }

    /// @}
    /// @defgroup order Ordering
    /// @{

    /// @brief Outputs stable-sorted by `key_fn(x)`, ascending.
    template<typename Xf, typename Iterable, typename F>
    auto sort_by(const Xf& xf, Iterable&& src, F key_fn) -> std::vector<output_t<Xf, impl::elem_t<Iterable>>>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;

        auto ret = td::to_vector(xf, std::forward<Iterable>(src));
        std::stable_sort(ret.begin(), ret.end(), [&key_fn](const out_t& x, const out_t& y)
        {
            return key_fn(x) < key_fn(y);
        });
        return ret;
    }

    /// @brief Outputs stable-sorted with the strict-weak-ordering `comp`.
    template<typename Xf, typename Iterable, typename Comp>
    auto sort_with(const Xf& xf, Iterable&& src, Comp comp) -> std::vector<output_t<Xf, impl::elem_t<Iterable>>>
    {
        auto ret = td::to_vector(xf, std::forward<Iterable>(src));
        std::stable_sort(ret.begin(), ret.end(), std::move(comp));
        return ret;
    }

    template<typename Xf, typename Iterable>
    auto reverse(const Xf& xf, Iterable&& src) -> std::vector<output_t<Xf, impl::elem_t<Iterable>>>
    {
        auto ret = td::to_vector(xf, std::forward<Iterable>(src));
        std::reverse(ret.begin(), ret.end());
        return ret;
    }

    /// @brief The `k` greatest outputs, in decreasing order.
    ///
    /// Keeps a min-heap of capacity `k`, so the memory is O(k) regardless of
    /// the number of inputs. Of equal outputs, the earlier ones are kept.
    /*!
    @code
        VERIFY(( td::top_k(td::identity(), vec_t{{ 1, 5, 2, 8, 3, 9, 4, 6, 7 }}, 3) == vec_t{{ 9, 8, 7 }} ));
    @endcode
    */
    template<typename Xf, typename Iterable>
    auto top_k(const Xf& xf, Iterable&& src, size_t k) -> std::vector<output_t<Xf, impl::elem_t<Iterable>>>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;
        using heap_t = std::vector<out_t>; // min at front

        if(k == 0) {
            return {};
        }

        const auto op_gt = [](const out_t& x, const out_t& y)
        {
            return y < x;
        };

        auto heap = td::reduce(xf, std::forward<Iterable>(src), heap_t{},
            [k, op_gt](heap_t acc, out_t x)
            {
                if(acc.size() < k) {
                    acc.push_back(std::move(x));
                    std::push_heap(acc.begin(), acc.end(), op_gt);

                } else if(acc.front() < x) {
                    std::pop_heap(acc.begin(), acc.end(), op_gt);
                    acc.back() = std::move(x);
                    std::push_heap(acc.begin(), acc.end(), op_gt);
                }
                return td::cont(std::move(acc));
            });

        std::sort_heap(heap.begin(), heap.end(), op_gt);
        return heap;
    }

    /// @brief Uniform random sample of up to `k` outputs, in a single pass.
    ///
    /// If there are at most `k` outputs, all of them are returned, in order.
    /// The sample is a function of the `seed` and the outputs.
    template<typename Xf, typename Iterable>
    auto reservoir_sample(const Xf& xf,
                          Iterable&& src,
                          size_t k,
                          std::mt19937::result_type seed = std::mt19937::default_seed)
        -> std::vector<output_t<Xf, impl::elem_t<Iterable>>>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;
        using acc_t = std::pair<std::vector<out_t>, size_t>; // (reservoir, number of outputs seen)

        if(k == 0) {
            return {};
        }

        return td::reduce(xf, std::forward<Iterable>(src), acc_t{ {}, 0 },
            [k, rng = std::mt19937{ seed }](acc_t acc, out_t x) mutable
            {
                ++acc.second;
                if(acc.first.size() < k) {
                    acc.first.push_back(std::move(x));
                } else {
                    const auto j = std::uniform_int_distribution<size_t>{ 0, acc.second - 1 }(rng);
                    if(j < k) {
                        acc.first[j] = std::move(x);
                    }
                }
                return td::cont(std::move(acc));
            }).first;
    }

    /// @}
    /// @defgroup stats Statistics
    /// The outputs are converted to double. An empty
    /// input yields an empty result rather than NaN.
    /// @{

namespace impl
{
    // Running count, mean, and sum of squared deviations from the mean.
    struct moments
    {
        size_t n;
        double mean;
        double m2;

        // Welford's update
        moments add(double x) const
        {
            const double delta = x - mean;
            const double new_mean = mean + delta / double(n + 1);
            return { n + 1, new_mean, m2 + delta * (x - new_mean) };
        }
    };

    template<typename Xf, typename Iterable>
    moments moments_of(const Xf& xf, Iterable&& src)
    {
        using out_t = output_t<Xf, elem_t<Iterable>>;

        return td::reduce(xf, std::forward<Iterable>(src), moments{ 0, 0.0, 0.0 },
            [](moments acc, const out_t& x)
            {
                return td::cont(acc.add(double(x)));
            });
    }

    template<typename Xf, typename Iterable>
    std::vector<double> sorted_doubles(const Xf& xf, Iterable&& src)
    {
        using out_t = output_t<Xf, elem_t<Iterable>>;

        auto ret = td::reduce(xf, std::forward<Iterable>(src), std::vector<double>{},
            [](std::vector<double> acc, const out_t& x)
            {
                acc.push_back(double(x));
                return td::cont(std::move(acc));
            });

        std::sort(ret.begin(), ret.end());
        return ret;
    }
}   // namespace impl

    /// @brief Arithmetic mean.
    template<typename Xf, typename Iterable>
    maybe<double> mean(const Xf& xf, Iterable&& src)
    {
        const auto m = impl::moments_of(xf, std::forward<Iterable>(src));
        return m.n == 0 ? maybe<double>{} : maybe<double>{ m.mean };
    }

    /// @brief Population variance, i.e. the mean squared deviation from the mean.
    template<typename Xf, typename Iterable>
    maybe<double> variance(const Xf& xf, Iterable&& src)
    {
        const auto m = impl::moments_of(xf, std::forward<Iterable>(src));
        return m.n == 0 ? maybe<double>{} : maybe<double>{ m.m2 / double(m.n) };
    }

    /// @brief Population standard deviation.
    template<typename Xf, typename Iterable>
    maybe<double> std_dev(const Xf& xf, Iterable&& src)
    {
        const auto var = td::variance(xf, std::forward<Iterable>(src));
        return var ? maybe<double>{ std::sqrt(*var) } : maybe<double>{};
    }

    /// @brief The `q`-quantile, `0 <= q <= 1`, linearly interpolating
    /// between the two closest ranks.
    ///
    /// Throws std::logic_error if `q` is out of range (before draining `src`).
    /*!
    @code
        VERIFY(( *td::quantile(td::identity(), vec_t{{ 4, 1, 3, 2 }}, 0.5)  == 2.5 ));
        VERIFY(( *td::quantile(td::identity(), vec_t{{ 4, 1, 3, 2 }}, 1.0)  == 4.0 ));
    @endcode
    */
    template<typename Xf, typename Iterable>
    maybe<double> quantile(const Xf& xf, Iterable&& src, double q)
    {
        if(!(q >= 0.0 && q <= 1.0)) {
            XDUCE_TD_THROW("Quantile must be within [0, 1].");
        }

        const auto vals = impl::sorted_doubles(xf, std::forward<Iterable>(src));
        if(vals.empty()) {
            return {};
        }

        const double pos  = q * double(vals.size() - 1);
        const size_t lo   = size_t(std::floor(pos));
        const size_t hi   = std::min(lo + 1, vals.size() - 1);
        const double frac = pos - double(lo);

        return { vals[lo] + (vals[hi] - vals[lo]) * frac };
    }

    /// @brief Middle value; the mean of the two middle values for even counts.
    template<typename Xf, typename Iterable>
    maybe<double> median(const Xf& xf, Iterable&& src)
    {
        return td::quantile(xf, std::forward<Iterable>(src), 0.5);
    }

    /// @brief Most frequent output; the least one wins ties.
    template<typename Xf, typename Iterable>
    auto mode(const Xf& xf, Iterable&& src) -> maybe<output_t<Xf, impl::elem_t<Iterable>>>
    {
        using out_t = output_t<Xf, impl::elem_t<Iterable>>;

        const auto freqs = td::frequencies(xf, std::forward<Iterable>(src));

        maybe<out_t> ret{};
        size_t max_count = 0;
        for(const auto& kv : freqs) {
            if(kv.second > max_count) {
                max_count = kv.second;
                ret.reset(kv.first);
            }
        }
        return ret;
    }

    /// @}
    /// @defgroup gen Generating
    /// Materialized sequences to feed to the collectors.
    /// @{

    /// @brief `n` copies of `value`.
    template<typename T>
    std::vector<T> repeat(const T& value, size_t n)
    {
        return std::vector<T>(n, value);
    }

    /// @brief Elements of `src`, in order, `times` times over.
    template<typename Iterable>
    auto cycle(const Iterable& src, size_t times) -> std::vector<impl::elem_t<const Iterable&>>
    {
        std::vector<impl::elem_t<const Iterable&>> ret{};
        for(size_t i = 0; i < times; i++) {
            ret.insert(ret.end(), std::begin(src), std::end(src));
        }
        return ret;
    }

    /// @brief Sequence generated from `seed`: `fn(state)` returns either an empty
    /// maybe to end the sequence, or the pair (next value, next state).
    ///
    /// At most `limit` values are generated.
    /*!
    @code
        // powers of two below 100
        auto res = td::unfold(1, [](int x)
        {
            return x < 100 ? td::maybe<std::pair<int, int>>{{ x, x * 2 }}
                           : td::maybe<std::pair<int, int>>{};
        }, 1000);

        VERIFY(( res == vec_t{{ 1, 2, 4, 8, 16, 32, 64 }} ));
    @endcode
    */
    template<typename S, typename F>
    auto unfold(S seed, F fn, size_t limit)
        -> std::vector<typename impl::invoke_result_t<F, const S&>::value_type::first_type>
    {
        using value_t = typename impl::invoke_result_t<F, const S&>::value_type::first_type;

        std::vector<value_t> ret{};
        for(auto state = std::move(seed); ret.size() < limit; ) {
            auto next = fn(static_cast<const S&>(state));
            if(!next) {
                break;
            }
            ret.push_back(std::move(next->first));
            state = std::move(next->second);
        }
        return ret;
    }

    /// @}
    /// @defgroup multi Two-Sequence Helpers
    /// These operate on materialized iterables directly, outside of the
    /// single-input transducer model, and return vectors.
    /// @{

    /// @brief Pairs of corresponding elements, up to the shorter sequence.
    template<typename A, typename B>
    auto zip(const A& a, const B& b) -> std::vector<std::pair<impl::elem_t<const A&>, impl::elem_t<const B&>>>
    {
        std::vector<std::pair<impl::elem_t<const A&>, impl::elem_t<const B&>>> ret{};

        auto it_a = std::begin(a);
        auto it_b = std::begin(b);
        for(; it_a != std::end(a) && it_b != std::end(b); ++it_a, ++it_b) {
            ret.emplace_back(*it_a, *it_b);
        }
        return ret;
    }

    /// @brief `fn(a[i], b[i])` up to the shorter sequence.
    template<typename A, typename B, typename F>
    auto zip_with(const A& a, const B& b, F fn)
        -> std::vector<impl::invoke_result_t<F, const impl::elem_t<const A&>&, const impl::elem_t<const B&>&>>
    {
        std::vector<impl::invoke_result_t<F, const impl::elem_t<const A&>&, const impl::elem_t<const B&>&>> ret{};

        auto it_a = std::begin(a);
        auto it_b = std::begin(b);
        for(; it_a != std::end(a) && it_b != std::end(b); ++it_a, ++it_b) {
            ret.push_back(fn(*it_a, *it_b));
        }
        return ret;
    }

    /// @brief Pairs of corresponding elements up to the longer sequence,
    /// padding the shorter one with its fill-value.
    template<typename A, typename B>
    auto zip_longest(const A& a, const B& b, impl::elem_t<const A&> fill_a, impl::elem_t<const B&> fill_b)
        -> std::vector<std::pair<impl::elem_t<const A&>, impl::elem_t<const B&>>>
    {
        std::vector<std::pair<impl::elem_t<const A&>, impl::elem_t<const B&>>> ret{};

        auto it_a = std::begin(a);
        auto it_b = std::begin(b);
        while(it_a != std::end(a) || it_b != std::end(b)) {
            const bool has_a = it_a != std::end(a);
            const bool has_b = it_b != std::end(b);

            ret.emplace_back(has_a ? *it_a : fill_a,
                             has_b ? *it_b : fill_b);
            if(has_a) {
                ++it_a;
            }
            if(has_b) {
                ++it_b;
            }
        }
        return ret;
    }

    /// @brief Round-robin interleave of the sequences, until all are exhausted.
    /*!
    @code
        auto res = td::merge(std::vector<vec_t>{ vec_t{{ 1, 4, 7 }}, vec_t{{ 2, 5 }}, vec_t{{ 3 }} });
        VERIFY(( res == vec_t{{ 1, 2, 3, 4, 5, 7 }} ));
    @endcode
    */
    template<typename Seqs>
    auto merge(const Seqs& seqs) -> std::vector<impl::elem_t<const impl::elem_t<const Seqs&>&>>
    {
        using seq_t = impl::elem_t<const Seqs&>;
        using iter_t = decltype(std::begin(std::declval<const seq_t&>()));

        std::vector<impl::elem_t<const seq_t&>> ret{};
        std::vector<std::pair<iter_t, iter_t>> its{};

        for(const auto& seq : seqs) {
            its.emplace_back(std::begin(seq), std::end(seq));
        }

        for(bool advanced = true; advanced; ) {
            advanced = false;
            for(auto& it : its) {
                if(it.first != it.second) {
                    ret.push_back(*it.first);
                    ++it.first;
                    advanced = true;
                }
            }
        }
        return ret;
    }

    /// @brief All pairs (x, y) with x from `a` and y from `b`, `a`-major.
    template<typename A, typename B>
    auto cartesian_product(const A& a, const B& b) -> std::vector<std::pair<impl::elem_t<const A&>, impl::elem_t<const B&>>>
    {
        std::vector<std::pair<impl::elem_t<const A&>, impl::elem_t<const B&>>> ret{};

        for(const auto& x : a) {
            for(const auto& y : b) {
                ret.emplace_back(x, y);
            }
        }
        return ret;
    }

    /// @brief Elements of `a` that occur in `b`; `a`'s order and duplicates are kept.
    template<typename A, typename B>
    auto intersection(const A& a, const B& b) -> std::vector<impl::elem_t<const A&>>
    {
        const std::set<impl::elem_t<const B&>> in_b(std::begin(b), std::end(b));

        std::vector<impl::elem_t<const A&>> ret{};
        for(const auto& x : a) {
            if(in_b.count(x)) {
                ret.push_back(x);
            }
        }
        return ret;
    }

    /// @brief Elements of `a` that do not occur in `b`; `a`'s order and duplicates are kept.
    template<typename A, typename B>
    auto difference(const A& a, const B& b) -> std::vector<impl::elem_t<const A&>>
    {
        const std::set<impl::elem_t<const B&>> in_b(std::begin(b), std::end(b));

        std::vector<impl::elem_t<const A&>> ret{};
        for(const auto& x : a) {
            if(!in_b.count(x)) {
                ret.push_back(x);
            }
        }
        return ret;
    }

    /// @brief Distinct elements of `a` in first-occurrence order, followed
    /// by distinct elements of `b` not in `a`.
    template<typename A, typename B>
    auto set_union(const A& a, const B& b) -> std::vector<impl::elem_t<const A&>>
    {
        std::set<impl::elem_t<const A&>> seen{};

        std::vector<impl::elem_t<const A&>> ret{};
        for(const auto& x : a) {
            if(seen.insert(x).second) {
                ret.push_back(x);
            }
        }
        for(const auto& y : b) {
            if(seen.insert(y).second) {
                ret.push_back(y);
            }
        }
        return ret;
    }

    /// @brief Distinct elements of `a` not in `b`, followed by
    /// distinct elements of `b` not in `a`.
    template<typename A, typename B>
    auto symmetric_difference(const A& a, const B& b) -> std::vector<impl::elem_t<const A&>>
    {
        const std::set<impl::elem_t<const A&>> in_a(std::begin(a), std::end(a));
        const std::set<impl::elem_t<const B&>> in_b(std::begin(b), std::end(b));
        std::set<impl::elem_t<const A&>> seen{};

        std::vector<impl::elem_t<const A&>> ret{};
        for(const auto& x : a) {
            if(!in_b.count(x) && seen.insert(x).second) {
                ret.push_back(x);
            }
        }
        for(const auto& y : b) {
            if(!in_a.count(y) && seen.insert(y).second) {
                ret.push_back(y);
            }
        }
        return ret;
    }

    /// @}

} // namespace td

} // namespace xduce

#define XDUCE_COLLECT_HPP_COMPLETE_

#if XDUCE_COLLECT_ENABLE_RUN_TESTS
#include <map>
#include <memory>
#include <string>
#include <iostream>
#include <stdexcept>
#include <limits>

#ifndef VERIFY
#define VERIFY(expr) if(!(expr)) XDUCE_TD_THROW("Assertion failed: ( "#expr" ).");
#endif

namespace xduce
{
namespace td
{
namespace impl
{
namespace collect_tests
{

static void run_tests()
{
    using vec_t = std::vector<int>;

    std::map<std::string, std::function<void()>> tests{};

    const auto is_even = [](int x) { return x % 2 == 0; };

    const auto near = [](double x, double y) { return std::abs(x - y) < 1e-9; };

    /////////////////////////////////////////////////////////////////////////

    tests["range"] = [&]
    {
        VERIFY(( td::to_vector(td::identity(), td::range(1, 5))      == vec_t{{ 1, 2, 3, 4 }} ));
        VERIFY(( td::to_vector(td::identity(), td::range(1, 10, 3))  == vec_t{{ 1, 4, 7 }} ));
        VERIFY(( td::to_vector(td::identity(), td::range(5, 0, -2))  == vec_t{{ 5, 3, 1 }} ));
        VERIFY(( td::to_vector(td::identity(), td::range(5, 5))      == vec_t{} ));
        VERIFY(( td::to_vector(td::identity(), td::range(5, 1))      == vec_t{} ));

        // no overflow when the last stride oversteps the end
        VERIFY(td::count(td::identity(), td::range(uint8_t(0), uint8_t(255), uint8_t(100))) == 3);

        // neither the distance to the end nor the stride fit in int
        const int lo = std::numeric_limits<int>::min();
        const int hi = std::numeric_limits<int>::max();

        VERIFY(( td::to_vector(td::identity(), td::range(lo + 1, hi, 1 << 30))
                 == vec_t{{ lo + 1, -(1 << 30) + 1, 1, (1 << 30) + 1 }} ));

        VERIFY(( td::to_vector(td::identity(), td::range(hi, lo, -(1 << 30)))
                 == vec_t{{ hi, (1 << 30) - 1, -1, -(1 << 30) - 1 }} ));

        VERIFY(( td::to_vector(td::identity(), td::range(hi, lo, lo)) == vec_t{{ hi, -1 }} ));

        bool threw = false;
        try {
            td::range(0, 10, 0);
        } catch(const std::logic_error&) {
            threw = true;
        }
        VERIFY(threw);
    };

    tests["to_vector"] = [&]
    {
        // elements of an rvalue source are moved into the chain
        std::vector<std::unique_ptr<int>> ptrs{};
        ptrs.emplace_back(new int(1));
        ptrs.emplace_back(new int(2));

        auto res = td::to_vector(td::identity(), std::move(ptrs));
        VERIFY(res.size() == 2 && *res[0] == 1 && *res[1] == 2);

        // elements of an lvalue source are copied
        const vec_t src{{ 1, 2, 3 }};
        VERIFY(td::to_vector(td::map([](int x) { return x + 1; }), src) == (vec_t{{ 2, 3, 4 }}));
        VERIFY(src == (vec_t{{ 1, 2, 3 }}));
    };

    tests["reduce"] = [&]
    {
        size_t num_pulled = 0;
        const auto res = td::reduce(
            td::tap([&num_pulled](int) { ++num_pulled; }),
            td::range(1, 100),
            0,
            [](int acc, int x)
            {
                return x == 5 ? td::stop(acc) : td::cont(acc + x);
            });

        VERIFY(res == 10);
        VERIFY(num_pulled == 5); // the element after the stopping one is never pulled
    };

    tests["sum/product/count"] = [&]
    {
        VERIFY(td::sum(td::identity(), vec_t{{ 1, 2, 3, 4 }}) == 10);
        VERIFY(td::sum(td::identity(), vec_t{}) == 0);
        VERIFY(td::sum(td::map([](int x) { return std::to_string(x); }), vec_t{{ 1, 2 }}) == "12");

        VERIFY(td::product(td::identity(), vec_t{{ 1, 2, 3, 4 }}) == 24);
        VERIFY(td::product(td::identity(), vec_t{}) == 1);

        VERIFY(td::count(td::filter(is_even), td::range(0, 10)) == 5);
    };

    tests["first/last"] = [&]
    {
        size_t num_pulled = 0;
        const auto res = td::first(td::tap([&num_pulled](int) { ++num_pulled; }), td::range(7, 100));
        VERIFY(res && *res == 7);
        VERIFY(num_pulled == 1);

        VERIFY(!td::first(td::identity(), vec_t{}));
        VERIFY(*td::first(td::filter(is_even), vec_t{{ 1, 3, 4, 6 }}) == 4);

        VERIFY(*td::last(td::identity(), vec_t{{ 1, 2, 3 }}) == 3);
        VERIFY(!td::last(td::identity(), vec_t{}));
    };

    tests["every/some/none"] = [&]
    {
        VERIFY( td::every(td::identity(), vec_t{{ 2, 4 }}, is_even));
        VERIFY(!td::every(td::identity(), vec_t{{ 2, 3 }}, is_even));
        VERIFY( td::every(td::identity(), vec_t{}, is_even));

        VERIFY( td::some(td::identity(), vec_t{{ 1, 4 }}, is_even));
        VERIFY(!td::some(td::identity(), vec_t{{ 1, 3 }}, is_even));
        VERIFY(!td::some(td::identity(), vec_t{}, is_even));

        VERIFY( td::none(td::identity(), vec_t{{ 1, 3 }}, is_even));
        VERIFY(!td::none(td::identity(), vec_t{{ 1, 4 }}, is_even));

        // stops on the first failing element
        size_t num_pulled = 0;
        VERIFY(!td::every(td::tap([&num_pulled](int) { ++num_pulled; }), vec_t{{ 2, 3, 4, 5 }}, is_even));
        VERIFY(num_pulled == 2);
    };

    tests["contains/find"] = [&]
    {
        VERIFY( td::contains(td::identity(), td::range(0, 1000000), 3));
        VERIFY(!td::contains(td::identity(), vec_t{{ 1, 2 }}, 3));

        const auto res = td::find(td::identity(), vec_t{{ 1, 3, 4, 6 }}, is_even);
        VERIFY(res && *res == 4);
        VERIFY(!td::find(td::identity(), vec_t{{ 1, 3 }}, is_even));
    };

    tests["min/max"] = [&]
    {
        VERIFY(*td::min(td::identity(), vec_t{{ 3, 1, 2 }}) == 1);
        VERIFY(*td::max(td::identity(), vec_t{{ 3, 1, 2 }}) == 3);
        VERIFY(!td::min(td::identity(), vec_t{}));
        VERIFY(!td::max(td::identity(), vec_t{}));

        // the first extreme element wins ties
        using pair_t = std::pair<int, char>;
        const std::vector<pair_t> src{ {2, 'a'}, {1, 'b'}, {1, 'c'}, {3, 'd'}, {3, 'e'} };
        const auto key = [](const pair_t& p) { return p.first; };

        VERIFY(td::min_by(td::identity(), src, key)->second == 'b');
        VERIFY(td::max_by(td::identity(), src, key)->second == 'd');
    };

    tests["partition"] = [&]
    {
        const auto res = td::partition(td::identity(), vec_t{{ 1, 2, 3, 4, 5 }}, is_even);
        VERIFY(( res.first  == vec_t{{ 2, 4 }} ));
        VERIFY(( res.second == vec_t{{ 1, 3, 5 }} ));
    };

    tests["group_by"] = [&]
    {
        const auto res = td::group_by(td::identity(), vec_t{{ 1, 2, 3, 4, 5, 6 }}, [](int x) { return x % 3; });
        VERIFY(( res == std::map<int, vec_t>{ { 0, vec_t{{ 3, 6 }} },
                                              { 1, vec_t{{ 1, 4 }} },
                                              { 2, vec_t{{ 2, 5 }} } } ));

        VERIFY(td::group_by(td::identity(), vec_t{}, [](int x) { return x % 3; }).empty());
    };

    tests["frequencies"] = [&]
    {
        const auto res = td::frequencies(td::identity(), vec_t{{ 1, 1, 2, 1, 2, 3 }});
        VERIFY(( res == std::map<int, size_t>{ { 1, 3 }, { 2, 2 }, { 3, 1 } } ));
    };

    tests["partition_by"] = [&]
    {
        const auto res = td::partition_by(td::identity(), vec_t{{ 1, 1, 2, 3, 3, 1 }}, by::identity{});
        VERIFY(( res == std::vector<vec_t>{ vec_t{{ 1, 1 }}, vec_t{{ 2 }}, vec_t{{ 3, 3 }}, vec_t{{ 1 }} } ));

        VERIFY(td::partition_by(td::identity(), vec_t{}, by::identity{}).empty());
    };

    tests["take_last"] = [&]
    {
        VERIFY(( td::take_last(td::identity(), td::range(1, 6), 2)  == vec_t{{ 4, 5 }} ));
        VERIFY(( td::take_last(td::identity(), td::range(1, 6), 0)  == vec_t{} ));
        VERIFY(( td::take_last(td::identity(), td::range(1, 4), 10) == vec_t{{ 1, 2, 3 }} ));
    };

    tests["drop_last"] = [&]
    {
        VERIFY(( td::drop_last(td::identity(), td::range(1, 6), 2)  == vec_t{{ 1, 2, 3 }} ));
        VERIFY(( td::drop_last(td::identity(), td::range(1, 4), 0)  == vec_t{{ 1, 2, 3 }} ));
        VERIFY(( td::drop_last(td::identity(), td::range(1, 4), 10) == vec_t{} ));

        // drop_last and take_last split the outputs
        const auto doubled = td::map([](int x) { return x * 2; });
        auto res = td::drop_last(doubled, td::range(1, 8), 3);
        const auto tail = td::take_last(doubled, td::range(1, 8), 3);
        res.insert(res.end(), tail.begin(), tail.end());
        VERIFY(( res == td::to_vector(doubled, td::range(1, 8)) ));
    };

    tests["sort_by/sort_with/reverse"] = [&]
    {
        const std::vector<std::string> words{ "ccc", "a", "bb", "dd", "e" };
        const auto by_size = [](const std::string& w) { return w.size(); };

        // stable: equal keys keep their input order
        VERIFY(( td::sort_by(td::identity(), words, by_size)
                 == std::vector<std::string>{ "a", "e", "bb", "dd", "ccc" } ));

        VERIFY(( td::sort_with(td::identity(), vec_t{{ 3, 1, 2 }}, [](int x, int y) { return x > y; })
                 == vec_t{{ 3, 2, 1 }} ));

        VERIFY(( td::reverse(td::filter(is_even), td::range(1, 7)) == vec_t{{ 6, 4, 2 }} ));
        VERIFY(( td::reverse(td::identity(), vec_t{}) == vec_t{} ));
    };

    tests["top_k"] = [&]
    {
        const vec_t inp{{ 1, 5, 2, 8, 3, 9, 4, 6, 7 }};

        VERIFY(( td::top_k(td::identity(), inp, 3)  == vec_t{{ 9, 8, 7 }} ));
        VERIFY(( td::top_k(td::identity(), inp, 0)  == vec_t{} ));
        VERIFY(( td::top_k(td::identity(), vec_t{{ 1, 2, 3 }}, 10) == vec_t{{ 3, 2, 1 }} ));
        VERIFY(( td::top_k(td::identity(), vec_t{}, 3) == vec_t{} ));
        VERIFY(( td::top_k(td::identity(), vec_t{{ 2, 7, 7, 1, 7 }}, 2) == vec_t{{ 7, 7 }} ));

        VERIFY(( td::top_k(td::map([](int x) { return x * 2; }), vec_t{{ 1, 5, 2, 8, 3 }}, 3)
                 == vec_t{{ 16, 10, 6 }} ));
    };

    tests["reservoir_sample"] = [&]
    {
        const auto sample = td::reservoir_sample(td::identity(), td::range(1, 101), 10);
        VERIFY(sample.size() == 10);
        VERIFY(td::every(td::identity(), sample, [](int x) { return 1 <= x && x <= 100; }));

        // distinct inputs are sampled without replacement
        VERIFY(td::count(td::unique_by([](int x) { return x; }), sample) == 10);

        // same seed, same sample
        VERIFY(( td::reservoir_sample(td::identity(), td::range(1, 101), 10, 42)
              == td::reservoir_sample(td::identity(), td::range(1, 101), 10, 42) ));

        VERIFY(( td::reservoir_sample(td::identity(), vec_t{{ 1, 2, 3 }}, 10) == vec_t{{ 1, 2, 3 }} ));
        VERIFY(( td::reservoir_sample(td::identity(), vec_t{}, 10) == vec_t{} ));
        VERIFY(( td::reservoir_sample(td::identity(), td::range(1, 101), 0) == vec_t{} ));

        VERIFY(td::every(td::identity(),
                         td::reservoir_sample(td::map([](int x) { return x * 2; }), td::range(1, 51), 5),
                         is_even));
    };

    tests["mean/variance/std_dev"] = [&]
    {
        const vec_t inp{{ 2, 4, 4, 4, 5, 5, 7, 9 }};

        VERIFY(near(*td::mean(td::identity(), inp),     5.0));
        VERIFY(near(*td::variance(td::identity(), inp), 4.0));
        VERIFY(near(*td::std_dev(td::identity(), inp),  2.0));

        VERIFY(near(*td::mean(td::take(3), inp), 10.0 / 3));
        VERIFY(near(*td::variance(td::identity(), vec_t{{ 7 }}), 0.0));

        VERIFY(!td::mean(td::identity(), vec_t{}));
        VERIFY(!td::variance(td::identity(), vec_t{}));
        VERIFY(!td::std_dev(td::identity(), vec_t{}));
    };

    tests["median/quantile"] = [&]
    {
        VERIFY(*td::median(td::identity(), vec_t{{ 3, 1, 2 }})    == 2.0);
        VERIFY(*td::median(td::identity(), vec_t{{ 4, 1, 3, 2 }}) == 2.5);
        VERIFY(!td::median(td::identity(), vec_t{}));

        const vec_t inp{{ 10, 40, 20, 30, 50 }};
        VERIFY(near(*td::quantile(td::identity(), inp, 0.0),  10.0));
        VERIFY(near(*td::quantile(td::identity(), inp, 0.25), 20.0));
        VERIFY(near(*td::quantile(td::identity(), inp, 0.1),  14.0));
        VERIFY(near(*td::quantile(td::identity(), inp, 1.0),  50.0));

        bool threw = false;
        try {
            td::quantile(td::identity(), inp, 1.5);
        } catch(const std::logic_error&) {
            threw = true;
        }
        VERIFY(threw);
    };

    tests["mode"] = [&]
    {
        VERIFY(*td::mode(td::identity(), vec_t{{ 1, 3, 2, 3, 1, 3 }}) == 3);
        VERIFY(*td::mode(td::identity(), vec_t{{ 5, 2, 5, 2 }}) == 2);
        VERIFY(!td::mode(td::identity(), vec_t{}));
    };

    tests["repeat/cycle/unfold"] = [&]
    {
        VERIFY(( td::repeat(7, 3) == vec_t{{ 7, 7, 7 }} ));
        VERIFY(( td::repeat(7, 0) == vec_t{} ));

        VERIFY(( td::cycle(vec_t{{ 1, 2 }}, 3) == vec_t{{ 1, 2, 1, 2, 1, 2 }} ));
        VERIFY(( td::cycle(vec_t{}, 3) == vec_t{} ));

        using next_t = maybe<std::pair<int, int>>;
        const auto powers_of_two = [](const int& x)
        {
            return x < 100 ? next_t{ std::make_pair(x, x * 2) } : next_t{};
        };
        VERIFY(( td::unfold(1, powers_of_two, 1000) == vec_t{{ 1, 2, 4, 8, 16, 32, 64 }} ));
        VERIFY(( td::unfold(1, powers_of_two, 3)    == vec_t{{ 1, 2, 4 }} ));

        // the first 20 fibonacci numbers
        const auto fib = td::unfold(std::make_pair(0, 1), [](const std::pair<int, int>& st)
        {
            return maybe<std::pair<int, std::pair<int, int>>>{
                std::make_pair(st.first, std::make_pair(st.second, st.first + st.second)) };
        }, 20);
        VERIFY(( td::to_vector(td::filter(is_even), fib) == vec_t{{ 0, 2, 8, 34, 144, 610, 2584 }} ));
    };

    /////////////////////////////////////////////////////////////////////////

    tests["zip"] = [&]
    {
        const vec_t a{{ 1, 2, 3 }};
        const std::vector<std::string> b{ "a", "b" };

        const auto res = td::zip(a, b);
        VERIFY(res.size() == 2);
        VERIFY(res[0] == std::make_pair(1, std::string("a")));
        VERIFY(res[1] == std::make_pair(2, std::string("b")));

        VERIFY(( td::zip_with(a, vec_t{{ 10, 20 }}, [](int x, int y) { return x + y; }) == vec_t{{ 11, 22 }} ));
        VERIFY(td::zip(a, vec_t{}).empty());
    };

    tests["zip_longest"] = [&]
    {
        const auto res = td::zip_longest(vec_t{{ 1, 2, 3 }}, vec_t{{ 10 }}, 0, -1);
        VERIFY(( res == std::vector<std::pair<int, int>>{ {1, 10}, {2, -1}, {3, -1} } ));

        const auto res2 = td::zip_longest(vec_t{}, vec_t{{ 10, 20 }}, 0, -1);
        VERIFY(( res2 == std::vector<std::pair<int, int>>{ {0, 10}, {0, 20} } ));
    };

    tests["merge"] = [&]
    {
        const auto res = td::merge(std::vector<vec_t>{ vec_t{{ 1, 4, 7 }}, vec_t{{ 2, 5 }}, vec_t{{ 3 }} });
        VERIFY(( res == vec_t{{ 1, 2, 3, 4, 5, 7 }} ));

        VERIFY(td::merge(std::vector<vec_t>{}).empty());
        VERIFY(( td::merge(std::vector<vec_t>{ vec_t{}, vec_t{{ 1, 2 }} }) == vec_t{{ 1, 2 }} ));
    };

    tests["cartesian_product"] = [&]
    {
        const auto res = td::cartesian_product(vec_t{{ 1, 2 }}, std::string("ab"));
        VERIFY(( res == std::vector<std::pair<int, char>>{ {1, 'a'}, {1, 'b'}, {2, 'a'}, {2, 'b'} } ));

        VERIFY(td::cartesian_product(vec_t{}, std::string("ab")).empty());
    };

    tests["set operations"] = [&]
    {
        const vec_t v{{ 3, 1, 3, 2 }};

        VERIFY(( td::intersection(vec_t{{ 1, 2, 2, 3, 4 }}, vec_t{{ 2, 4, 5 }}) == vec_t{{ 2, 2, 4 }} ));
        VERIFY(td::intersection(v, v) == v);
        VERIFY(td::intersection(v, vec_t{}).empty());

        VERIFY(( td::difference(vec_t{{ 1, 2, 2, 3, 4 }}, vec_t{{ 2, 4, 5 }}) == vec_t{{ 1, 3 }} ));
        VERIFY(td::difference(v, vec_t{}) == v);
        VERIFY(td::difference(v, v).empty());

        VERIFY(( td::set_union(v, vec_t{{ 2, 5, 1, 6 }}) == vec_t{{ 3, 1, 2, 5, 6 }} ));
        VERIFY(( td::set_union(vec_t{}, v) == vec_t{{ 3, 1, 2 }} ));

        VERIFY(( td::symmetric_difference(vec_t{{ 1, 2, 2, 3 }}, vec_t{{ 3, 4, 4, 5 }}) == vec_t{{ 1, 2, 4, 5 }} ));
        VERIFY(td::symmetric_difference(v, v).empty());
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

} // namespace collect_tests
} // namespace impl
} // namespace td
} // namespace xduce

#endif //XDUCE_COLLECT_ENABLE_RUN_TESTS

#endif // #ifndef XDUCE_COLLECT_HPP_

// td.hpp's tests need the collectors; see the end of td.hpp.
#if XDUCE_TD_ENABLE_RUN_TESTS
#include "td.hpp"
#endif

////////////////////////////////////////////////////////////////////////////////
/// Classic contiguous vector around the CRT allocation APIs: trivially
/// moveable types are relocated with realloc (eliminating the copy-on-resize
/// overhead of std::vector), everything else element by element.
/// Grows by 1.5x (minimum +1), never shrinks on element removal and counts the
/// buffer replacements it performs + vector_impl extensions.
////////////////////////////////////////////////////////////////////////////////
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <kore/coll/containers/errors.hpp>
#include <kore/coll/containers/is_trivially_moveable.hpp>
#include <kore/coll/containers/vector_impl.hpp>

#include <boost/assert.hpp>
#include <boost/config.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <memory>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace kore::coll
{
//------------------------------------------------------------------------------

namespace detail
{
    // https://www.gnu.org/software/libc/manual/html_node/Aligned-Memory-Blocks.html
    inline std::size_t constexpr guaranteed_alignment{ alignof( std::max_align_t ) };

    [[ using gnu: malloc, returns_nonnull ]]
    inline void * crt_allocate( std::size_t const byte_size, std::size_t const alignment )
    {
        void * new_allocation{ nullptr };
        if ( alignment > guaranteed_alignment )
        {
            if ( ::posix_memalign( &new_allocation, alignment, byte_size ) != 0 ) [[ unlikely ]]
                new_allocation = nullptr;
        }
        else
        {
            new_allocation = std::malloc( byte_size );
        }
        if ( !new_allocation ) [[ unlikely ]]
            throw_bad_alloc();
        return new_allocation;
    }

    [[ gnu::returns_nonnull ]]
    inline void * crt_realloc( void * const existing_allocation_address, std::size_t const new_size )
    {
        auto const new_allocation{ std::realloc( existing_allocation_address, new_size ) };
        if ( !new_allocation ) [[ unlikely ]]
            throw_bad_alloc();
        return new_allocation;
    }

    inline void crt_free( void * const allocation ) noexcept { std::free( allocation ); }
} // namespace detail

struct with_capacity_t {}; inline constexpr with_capacity_t with_capacity;


template <typename T, typename sz_t = std::size_t>
class [[ nodiscard ]] growable_vector
    :
    public vector_impl<growable_vector<T, sz_t>, T, sz_t>
{
public:
    using size_type  = sz_t;
    using value_type = T;

    // applied on the first growth of a vector which was not given an explicit
    // capacity
    static size_type constexpr default_capacity{ 10 };

private:
    using base = vector_impl<growable_vector<T, sz_t>, T, sz_t>;

    static bool constexpr realloc_relocatable{ is_trivially_moveable<T> && ( alignof( T ) <= detail::guaranteed_alignment ) };

public:
    constexpr growable_vector() noexcept : p_array_{ nullptr }, size_{ 0 }, capacity_{ 0 }, reallocations_{ 0 }, explicit_capacity_{ false } {}

    growable_vector( with_capacity_t, size_type const initial_capacity )
        : growable_vector()
    {
        explicit_capacity_ = true;
        if ( initial_capacity )
            relocate( initial_capacity );
    }

    growable_vector( std::initializer_list<value_type> const values )
        : growable_vector()
    {
        this->append_range( values );
    }

    growable_vector( growable_vector const & other )
        : growable_vector()
    {
        if ( other.empty() )
            return;
        auto const data{ allocate( other.size() ) };
        try { std::uninitialized_copy_n( other.data(), other.size(), data ); }
        catch(...) { detail::crt_free( data ); throw; }
        p_array_  = data;
        size_     = other.size();
        capacity_ = other.size();
    }
    constexpr growable_vector( growable_vector && other ) noexcept
        : p_array_{ other.p_array_ }, size_{ other.size_ }, capacity_{ other.capacity_ }, reallocations_{ other.reallocations_ }, explicit_capacity_{ other.explicit_capacity_ }
    {
        other.mark_freed();
    }

    growable_vector & operator=( growable_vector const & other ) { return *this = growable_vector( other ); }
    growable_vector & operator=( growable_vector && other ) noexcept
    {
        std::swap( this->p_array_          , other.p_array_           );
        std::swap( this->size_             , other.size_              );
        std::swap( this->capacity_         , other.capacity_          );
        std::swap( this->reallocations_    , other.reallocations_     );
        std::swap( this->explicit_capacity_, other.explicit_capacity_ );
        other.free();
        return *this;
    }
    ~growable_vector() noexcept { free(); }

    [[ nodiscard, gnu::pure ]] size_type size    () const noexcept { return size_; }
    [[ nodiscard, gnu::pure ]] size_type capacity() const noexcept { BOOST_ASSERT( capacity_ >= size_ ); return capacity_; }

    [[ nodiscard, gnu::pure ]] value_type       * data()       noexcept { return p_array_; }
    [[ nodiscard, gnu::pure ]] value_type const * data() const noexcept { return p_array_; }

    //! <b>Effects</b>: Number of times an existing buffer was replaced by a
    //!   larger (or smaller, for shrink_to_fit) one.
    //!
    //! <b>Note</b>: Non-standard extension
    [[ nodiscard ]] std::size_t reallocation_count() const noexcept { return reallocations_; }

    void reserve( size_type const new_capacity )
    {
        if ( new_capacity > capacity_ )
            relocate( new_capacity );
    }

    void shrink_to_fit()
    {
        if ( capacity_ > size_ )
            relocate( size_ );
    }

private: friend base;
    value_type * storage_grow_to( size_type const target_size )
    {
        BOOST_ASSERT( target_size >= size_ );
        if ( target_size > capacity_ ) [[ unlikely ]]
            do_grow( target_size );
        size_ = target_size;
        return data();
    }

    void storage_shrink_size_to( size_type const target_size ) noexcept
    {
        BOOST_ASSERT( size_ >= target_size );
        size_ = target_size;
    }

private:
    [[ gnu::cold, gnu::noinline ]]
    void do_grow( size_type const target_size )
    {
        if ( target_size > base::max_size() ) [[ unlikely ]]
            detail::throw_bad_alloc();
        std::size_t const current_capacity{ capacity_ };
        std::size_t const geometric_capacity
        {
            ( current_capacity == 0 && !explicit_capacity_ )
                ? std::size_t{ default_capacity }
                : current_capacity + std::max<std::size_t>( current_capacity / 2, 1 )
        };
        auto const new_capacity{ std::max<std::size_t>( target_size, std::min<std::size_t>( geometric_capacity, base::max_size() ) ) };
        relocate( static_cast<size_type>( new_capacity ) );
    }

    void relocate( size_type const new_capacity )
    {
        BOOST_ASSERT( new_capacity >= size_ );
        if ( new_capacity == 0 )
        {
            free();
            return;
        }
        if constexpr ( realloc_relocatable )
        {
            p_array_ = static_cast<value_type *>( detail::crt_realloc( p_array_, new_capacity * sizeof( value_type ) ) );
        }
        else
        {
            auto const new_array{ allocate( new_capacity ) };
            try
            {
                if constexpr ( std::is_nothrow_move_constructible_v<value_type> || !std::is_copy_constructible_v<value_type> )
                    std::uninitialized_move_n( p_array_, size_, new_array );
                else
                    std::uninitialized_copy_n( p_array_, size_, new_array );
            }
            catch(...)
            {
                detail::crt_free( new_array );
                throw;
            }
            std::destroy_n( p_array_, size_ );
            detail::crt_free( p_array_ );
            p_array_ = new_array;
        }
        if ( capacity_ )
            ++reallocations_;
        capacity_ = new_capacity;
    }

    static value_type * allocate( size_type const count )
    {
        return static_cast<value_type *>( detail::crt_allocate( count * sizeof( value_type ), alignof( value_type ) ) );
    }

    void free() noexcept
    {
        std::destroy_n( p_array_, size_ );
        detail::crt_free( p_array_ );
        p_array_  = nullptr;
        size_     = 0;
        capacity_ = 0;
    }

    void mark_freed() noexcept
    {
        p_array_           = nullptr;
        size_              = 0;
        capacity_          = 0;
        reallocations_     = 0;
        explicit_capacity_ = false;
    }

private:
    T *         p_array_;
    size_type   size_;
    size_type   capacity_;
    std::size_t reallocations_;
    bool        explicit_capacity_;
}; // class growable_vector

//------------------------------------------------------------------------------
} // namespace kore::coll
//------------------------------------------------------------------------------

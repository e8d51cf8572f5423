#pragma once

#include <rcmeter/protocol/asset.hpp>
#include <rcmeter/protocol/base.hpp>
#include <rcmeter/protocol/exceptions.hpp>
#include <rcmeter/protocol/operation_util.hpp>
#include <rcmeter/protocol/types.hpp>

#include <fc/crypto/hex.hpp>
#include <fc/crypto/ripemd160.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/exception/exception.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/static_variant.hpp>
#include <fc/variant.hpp>
#include <fc/variant_object.hpp>

#include <limits>
#include <string>
#include <type_traits>
#include <utility>

/**
  * Strict decoding of JSON shaped fc::variant documents into protocol types.
  *
  * Unlike fc::from_variant, decoding never fills a missing field with its default:
  * every reflected member must be present in the input object, only fc::optional members
  * may be omitted. Keys the type does not reflect are ignored. Integers are range checked
  * against the width of the destination field, tagged unions are given as
  * `{ "type": "<name>", "value": { ... } }`.
  *
  * Shape errors are reported as fc::parse_error_exception carrying the path of the offending
  * field, a tag outside of the closed set of a static_variant is reported as
  * unknown_operation_exception.
  */
namespace rcmeter { namespace protocol {

namespace decoders
{
  /* Main decoder - distinguish which type is reflected or not. Begins decoding process. */
  template<typename T, bool is_defined = fc::reflector<T>::is_defined::value>
  struct main_decoder;

  namespace non_reflected_types
  {
    /* For all non reflected types which request specific decoder. */
    template<typename T>
    struct specific_type_decoder;
  }

  inline std::string member_path( const std::string& path, const char* name )
  {
    return path.empty() ? std::string( name ) : path + "." + name;
  }

  inline std::string element_path( const std::string& path, size_t i )
  {
    return path + "[" + std::to_string( i ) + "]";
  }

  template<typename T>
  struct is_optional_member : std::false_type {};

  template<typename T>
  struct is_optional_member< fc::optional<T> > : std::true_type {};

  /* Tools for decoding reflected types. */
  template<typename T>
  class visitor_member_decoder
  {
    public:
      visitor_member_decoder( const fc::variant_object& _obj, T& _value, const std::string& _path )
        : obj( _obj ), value( _value ), path( _path ) {}

      template<typename Member, class Class, Member (Class::*member)>
      void operator()( const char* name )const
      {
        const std::string field_path = member_path( path, name );
        auto itr = obj.find( name );

        if( itr == obj.end() )
        {
          if constexpr( is_optional_member<Member>::value )
          {
            value.*member = Member();
            return;
          }
          else
          {
            FC_THROW_EXCEPTION( fc::parse_error_exception, "Missing field ${path}", ("path", field_path) );
          }
        }

        main_decoder<Member> decoder;
        decoder.decode( itr->value(), value.*member, field_path );
      }

    private:
      const fc::variant_object& obj;
      T&                        value;
      const std::string&        path;
  };

  /* Decoding starting point. */
  template<typename T>
  struct main_decoder<T, true /* is_defined - type is reflected */>
  {
    static_assert( !fc::reflector<T>::is_enum::value, "reflected enums are not decoded from documents" );

    void decode( const fc::variant& v, T& value, const std::string& path )const
    {
      if( !v.is_object() )
        FC_THROW_EXCEPTION( fc::parse_error_exception, "Expected an object at ${path}", ("path", path) );

      visitor_member_decoder<T> visitor( v.get_object(), value, path );
      fc::reflector<T>::visit( visitor );
    }
  };

  template<typename T>
  struct main_decoder<T, false /* is_defined - type is not reflected */>
  {
    void decode( const fc::variant& v, T& value, const std::string& path )const
    {
      if constexpr( std::is_same<T, bool>::value )
      {
        if( !v.is_bool() )
          FC_THROW_EXCEPTION( fc::parse_error_exception, "Expected a boolean at ${path}", ("path", path) );
        value = v.as_bool();
      }
      /* Fundamental types other than bool have to fit the width of the field. */
      else if constexpr( std::is_fundamental<T>::value )
      {
        static_assert( std::is_integral<T>::value, "only integral fundamental types are decoded" );

        if( v.is_uint64() )
        {
          const uint64_t u = v.as_uint64();
          if( u > static_cast<uint64_t>( std::numeric_limits<T>::max() ) )
            FC_THROW_EXCEPTION( fc::parse_error_exception, "Value ${v} out of range at ${path}", ("v", u)("path", path) );
          value = static_cast<T>( u );
        }
        else if( v.is_int64() )
        {
          const int64_t i = v.as_int64();
          if( i < static_cast<int64_t>( std::numeric_limits<T>::min() ) ||
              ( i > 0 && static_cast<uint64_t>( i ) > static_cast<uint64_t>( std::numeric_limits<T>::max() ) ) )
            FC_THROW_EXCEPTION( fc::parse_error_exception, "Value ${v} out of range at ${path}", ("v", i)("path", path) );
          value = static_cast<T>( i );
        }
        else
        {
          FC_THROW_EXCEPTION( fc::parse_error_exception, "Expected an integer at ${path}", ("path", path) );
        }
      }
      else
      {
        non_reflected_types::specific_type_decoder<T> decoder;
        decoder.decode( v, value, path );
      }
    }
  };

  /* Asset symbols are written as {nai, decimals} in documents instead of their packed number. */
  template<>
  struct main_decoder< asset_symbol_type, true >
  {
    void decode( const fc::variant& v, asset_symbol_type& value, const std::string& path )const
    {
      if( !v.is_object() )
        FC_THROW_EXCEPTION( fc::parse_error_exception, "Expected a {nai, decimals} object at ${path}", ("path", path) );

      const auto& obj = v.get_object();
      auto nai_itr = obj.find( "nai" );
      auto decimals_itr = obj.find( "decimals" );
      if( nai_itr == obj.end() || !nai_itr->value().is_string() )
        FC_THROW_EXCEPTION( fc::parse_error_exception, "Missing nai at ${path}", ("path", path) );
      if( decimals_itr == obj.end() )
        FC_THROW_EXCEPTION( fc::parse_error_exception, "Missing decimals at ${path}", ("path", path) );

      uint8_t decimals = 0;
      main_decoder< uint8_t > decimals_decoder;
      decimals_decoder.decode( decimals_itr->value(), decimals, member_path( path, "decimals" ) );

      try
      {
        value = asset_symbol_type::from_nai_string( nai_itr->value().get_string(), decimals );
      }
      FC_CAPTURE_AND_RETHROW( (path) )
    }
  };

  namespace non_reflected_types
  {
    /* Below are defined decoders for non reflected types which need to be handled separately. */
    template<>
    struct specific_type_decoder<std::string>
    {
      void decode( const fc::variant& v, std::string& value, const std::string& path )const
      {
        if( !v.is_string() )
          FC_THROW_EXCEPTION( fc::parse_error_exception, "Expected a string at ${path}", ("path", path) );
        value = v.get_string();
      }
    };

    template<typename T>
    struct specific_type_decoder< std::vector<T> >
    {
      void decode( const fc::variant& v, std::vector<T>& value, const std::string& path )const
      {
        if( !v.is_array() )
          FC_THROW_EXCEPTION( fc::parse_error_exception, "Expected an array at ${path}", ("path", path) );

        const auto& arr = v.get_array();
        value.clear();
        value.resize( arr.size() );
        for( size_t i = 0; i < arr.size(); ++i )
        {
          main_decoder<T> decoder;
          decoder.decode( arr[i], value[i], element_path( path, i ) );
        }
      }
    };

    /* Binary payloads are given as hex strings. */
    template<>
    struct specific_type_decoder< std::vector<char> >
    {
      void decode( const fc::variant& v, std::vector<char>& value, const std::string& path )const
      {
        if( !v.is_string() )
          FC_THROW_EXCEPTION( fc::parse_error_exception, "Expected a hex string at ${path}", ("path", path) );

        const std::string& hex = v.get_string();
        if( hex.size() % 2 )
          FC_THROW_EXCEPTION( fc::parse_error_exception, "Odd length of hex string at ${path}", ("path", path) );

        value.resize( hex.size() / 2 );
        if( value.size() )
        {
          size_t r = fc::from_hex( hex, value.data(), value.size() );
          FC_ASSERT( r == value.size(), "Invalid hex string at ${path}", ("path", path) );
        }
      }
    };

    /* Reserved extensions carry nothing yet, any entry is refused. */
    template<>
    struct specific_type_decoder< extensions_type >
    {
      void decode( const fc::variant& v, extensions_type& value, const std::string& path )const
      {
        if( !v.is_array() )
          FC_THROW_EXCEPTION( fc::parse_error_exception, "Expected an array at ${path}", ("path", path) );
        if( v.get_array().size() )
          FC_THROW_EXCEPTION( fc::parse_error_exception, "Extensions are not supported at ${path}", ("path", path) );
        value.clear();
      }
    };

    template<typename A, typename B>
    struct specific_type_decoder< std::pair<A, B> >
    {
      void decode( const fc::variant& v, std::pair<A, B>& value, const std::string& path )const
      {
        if( !v.is_array() || v.get_array().size() != 2 )
          FC_THROW_EXCEPTION( fc::parse_error_exception, "Expected a pair at ${path}", ("path", path) );

        const auto& arr = v.get_array();
        main_decoder<A> decoder_A;
        decoder_A.decode( arr[0], value.first, element_path( path, 0 ) );
        main_decoder<B> decoder_B;
        decoder_B.decode( arr[1], value.second, element_path( path, 1 ) );
      }
    };

    template<typename K, typename V>
    struct specific_type_decoder< flat_map<K, V> >
    {
      void decode( const fc::variant& v, flat_map<K, V>& value, const std::string& path )const
      {
        if( !v.is_array() )
          FC_THROW_EXCEPTION( fc::parse_error_exception, "Expected an array of pairs at ${path}", ("path", path) );

        const auto& arr = v.get_array();
        value.clear();
        value.reserve( arr.size() );
        for( size_t i = 0; i < arr.size(); ++i )
        {
          std::pair<K, V> item;
          main_decoder< std::pair<K, V> > decoder;
          decoder.decode( arr[i], item, element_path( path, i ) );
          if( !value.insert( std::move( item ) ).second )
            FC_THROW_EXCEPTION( fc::parse_error_exception, "Duplicate key at ${path}", ("path", element_path( path, i )) );
        }
      }
    };

    template<typename T>
    struct specific_type_decoder< flat_set<T> >
    {
      void decode( const fc::variant& v, flat_set<T>& value, const std::string& path )const
      {
        if( !v.is_array() )
          FC_THROW_EXCEPTION( fc::parse_error_exception, "Expected an array at ${path}", ("path", path) );

        const auto& arr = v.get_array();
        value.clear();
        value.reserve( arr.size() );
        for( size_t i = 0; i < arr.size(); ++i )
        {
          T item;
          main_decoder<T> decoder;
          decoder.decode( arr[i], item, element_path( path, i ) );
          if( !value.insert( std::move( item ) ).second )
            FC_THROW_EXCEPTION( fc::parse_error_exception, "Duplicate entry at ${path}", ("path", element_path( path, i )) );
        }
      }
    };

    template<typename T>
    struct specific_type_decoder< fc::optional<T> >
    {
      void decode( const fc::variant& v, fc::optional<T>& value, const std::string& path )const
      {
        if( v.is_null() )
        {
          value = fc::optional<T>();
          return;
        }

        T item;
        main_decoder<T> decoder;
        decoder.decode( v, item, path );
        value = std::move( item );
      }
    };

    template<typename... Types>
    struct specific_type_decoder< fc::static_variant<Types...> >
    {
      typedef fc::static_variant<Types...> variant_type;

      struct value_decoder
      {
        typedef void result_type;

        const fc::variant& v;
        const std::string& path;

        value_decoder( const fc::variant& _v, const std::string& _path ) : v( _v ), path( _path ) {}

        template<typename U>
        void operator()( U& u )const
        {
          main_decoder<U> decoder;
          decoder.decode( v, u, path );
        }
      };

      void decode( const fc::variant& v, variant_type& value, const std::string& path )const
      {
        if( !v.is_object() )
          FC_THROW_EXCEPTION( fc::parse_error_exception, "Expected a {type, value} object at ${path}", ("path", path) );

        const auto& obj = v.get_object();
        auto type_itr = obj.find( "type" );
        if( type_itr == obj.end() || !type_itr->value().is_string() )
          FC_THROW_EXCEPTION( fc::parse_error_exception, "Missing type name at ${path}", ("path", path) );

        const std::string& name = type_itr->value().get_string();
        const auto& name_table = static_variant_name_table< variant_type >();
        auto name_itr = name_table.find( name );
        if( name_itr == name_table.end() )
          FC_THROW_EXCEPTION( unknown_operation_exception, "Unknown type ${name} at ${path}", ("name", name)("path", path) );

        auto value_itr = obj.find( "value" );
        if( value_itr == obj.end() )
          FC_THROW_EXCEPTION( fc::parse_error_exception, "Missing value of ${name} at ${path}", ("name", name)("path", path) );

        value.set_which( name_itr->second );
        value.visit( value_decoder( value_itr->value(), member_path( path, "value" ) ) );
      }
    };

    template<>
    struct specific_type_decoder< asset >
    {
      void decode( const fc::variant& v, asset& value, const std::string& path )const
      { try {
        fc::from_variant( v, value );
      } FC_CAPTURE_AND_RETHROW( (path) ) }
    };

    template<>
    struct specific_type_decoder< fc::time_point_sec >
    {
      void decode( const fc::variant& v, fc::time_point_sec& value, const std::string& path )const
      {
        if( !v.is_string() )
          FC_THROW_EXCEPTION( fc::parse_error_exception, "Expected an ISO time string at ${path}", ("path", path) );
        try
        {
          value = fc::time_point_sec::from_iso_string( v.get_string() );
        }
        FC_CAPTURE_AND_RETHROW( (path) )
      }
    };

    template<>
    struct specific_type_decoder< wide_int >
    {
      void decode( const fc::variant& v, wide_int& value, const std::string& path )const
      { try {
        fc::from_variant( v, value );
      } FC_CAPTURE_AND_RETHROW( (path) ) }
    };

    /* Hashes are hex strings of the exact digest length. */
    template<typename H>
    struct hash_decoder
    {
      void decode( const fc::variant& v, H& value, const std::string& path )const
      {
        if( !v.is_string() || v.get_string().size() != 2 * H().data_size() )
          FC_THROW_EXCEPTION( fc::parse_error_exception, "Expected a ${n} byte hex digest at ${path}",
            ("n", H().data_size())("path", path) );
        try
        {
          value = H( v.get_string() );
        }
        FC_CAPTURE_AND_RETHROW( (path) )
      }
    };

    template<>
    struct specific_type_decoder< fc::ripemd160 > : public hash_decoder< fc::ripemd160 > {};

    template<>
    struct specific_type_decoder< fc::sha256 > : public hash_decoder< fc::sha256 > {};
  }
}

/**
  * Decodes @p v into @p value, @p path names the root of the document in error messages.
  */
template<typename T>
void decode_variant( const fc::variant& v, T& value, const std::string& path = std::string() )
{
  decoders::main_decoder<T> decoder;
  decoder.decode( v, value, path );
}

} } // rcmeter::protocol

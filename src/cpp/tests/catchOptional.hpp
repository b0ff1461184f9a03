#ifndef CATCH_OPTIONAL_H
#define CATCH_OPTIONAL_H

#include <string>

#include <boost/optional.hpp>
#include <catch2/catch.hpp>


namespace Catch
{
	template<typename T>
	struct StringMaker<boost::optional<T>>
	{
		static std::string convert(
			const boost::optional<T>& value)
		{
			return value ? "optional{...}" : "none";
		}
	};
}

#endif

#pragma once

#include <escrow/lib/errors.hpp>
#include <escrow/lib/numbers.hpp>
#include <escrow/lib/utility.hpp>

#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/optional.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/type_traits/has_right_shift.hpp>

#include <fstream>
#include <type_traits>

namespace escrow
{
/** Type trait to determine if T is compatible with boost's lexical_cast */
template <class T>
struct is_lexical_castable : std::integral_constant<bool,
                             (std::is_default_constructible<T>::value && (boost::has_right_shift<std::basic_istream<wchar_t>, T>::value || boost::has_right_shift<std::basic_istream<char>, T>::value))>
{
};

/** Manages a node in a boost configuration tree. */
class jsonconfig : public escrow::error_aware<>
{
public:
	jsonconfig () :
	tree (tree_default)
	{
		error = std::make_shared<escrow::error> ();
	}

	jsonconfig (boost::property_tree::ptree & tree_a, std::shared_ptr<escrow::error> error_a = nullptr) :
	error (error_a), tree (tree_a)
	{
		if (!error)
		{
			error = std::make_shared<escrow::error> ();
		}
	}

	/**
	 * Reads a json object from the stream and if it was changed, write the object back to the stream.
	 * @return escrow::error&, including a descriptive error message if the config file is malformed.
	 */
	template <typename T>
	escrow::error & read_and_update (T & object, boost::filesystem::path const & path_a)
	{
		auto file_exists (boost::filesystem::exists (path_a));
		read (path_a);
		if (!*error)
		{
			std::fstream stream;
			auto updated (false);
			*error = object.deserialize_json (updated, *this);
			if (!*error && updated)
			{
				stream.open (path_a.string (), std::ios_base::out | std::ios_base::trunc);
				try
				{
					boost::property_tree::write_json (stream, tree);
				}
				catch (std::runtime_error const & ex)
				{
					*error = ex;
				}
				stream.close ();
			}
			if (!file_exists)
			{
				escrow::set_secure_perm_file (path_a);
			}
		}
		return *error;
	}

	/** Open configuration file, create if necessary */
	void open_or_create (std::fstream & stream_a, std::string const & path_a)
	{
		if (!boost::filesystem::exists (path_a))
		{
			// Create temp stream to first create the file
			std::ofstream stream (path_a);

			// Set permissions before opening otherwise Windows only has read permissions
			escrow::set_secure_perm_file (path_a);
		}

		stream_a.open (path_a);
	}

	/** Returns the boost property node managed by this instance */
	boost::property_tree::ptree const & get_tree ()
	{
		return tree;
	}

	/** Returns true if the property tree node is empty */
	bool empty () const
	{
		return tree.empty ();
	}

	boost::optional<jsonconfig> get_optional_child (std::string const & key_a)
	{
		boost::optional<jsonconfig> child_config;
		auto child = tree.get_child_optional (key_a);
		if (child)
		{
			return jsonconfig (child.get (), error);
		}
		return child_config;
	}

	jsonconfig get_required_child (std::string const & key_a)
	{
		auto child = tree.get_child_optional (key_a);
		if (!child)
		{
			*error = escrow::error_config::missing_value;
			error->set_message ("Missing configuration node: " + key_a);
		}
		return child ? jsonconfig (child.get (), error) : *this;
	}

	jsonconfig & put_child (std::string const & key_a, escrow::jsonconfig & conf_a)
	{
		tree.add_child (key_a, conf_a.get_tree ());
		return *this;
	}

	/** Set value for the given key. Any existing value will be overwritten. */
	template <typename T>
	jsonconfig & put (std::string const & key, T const & value)
	{
		tree.put (key, value);
		return *this;
	}

	/** Returns true if \p key_a is present */
	bool has_key (std::string const & key_a)
	{
		return tree.find (key_a) != tree.not_found ();
	}

	/** Optional value. If the key is absent the target is left untouched */
	template <typename T>
	jsonconfig & get_optional (std::string const & key, T & target)
	{
		get_config<T> (true, key, target, target);
		return *this;
	}

	/** Optional value, using \p default_value if \p key is missing. */
	template <typename T>
	jsonconfig & get_optional (std::string const & key, T & target, T default_value)
	{
		get_config<T> (true, key, target, default_value);
		return *this;
	}

	/**
	 * Return a boost::optional<T> for the given key
	 * Boost.Optional is used here instead of std::optional to work with older compilers.
	 */
	template <typename T>
	boost::optional<T> get_optional (std::string const & key)
	{
		boost::optional<T> res;
		if (has_key (key))
		{
			T target{};
			get_config<T> (true, key, target, target);
			res = target;
		}
		return res;
	}

	/** Get value, using the current value as a default if \p key is missing. */
	template <typename T>
	jsonconfig & get (std::string const & key, T & target)
	{
		get_config<T> (true, key, target, target);
		return *this;
	}

	/** Get value of optional key. Use default value of data type if missing. */
	template <typename T>
	T get (std::string const & key)
	{
		T target{};
		get_config<T> (true, key, target, target);
		return target;
	}

	/** Get required value. Sets an error if the key is missing */
	template <typename T>
	jsonconfig & get_required (std::string const & key, T & target)
	{
		get_config<T> (false, key, target);
		return *this;
	}

	/** Get required value. Sets an error if the key is missing */
	template <typename T>
	T get_required (std::string const & key)
	{
		T target{};
		get_config<T> (false, key, target);
		return target;
	}

	/** Returns an error if any, otherwise escrow::error_common::generic */
	escrow::error & get_error () override
	{
		return *error;
	}

protected:
	template <typename T, typename = std::enable_if_t<escrow::is_lexical_castable<T>::value>>
	void construct (std::string const & key, T & target)
	{
		auto value (tree.get<std::string> (key));
		try
		{
			target = boost::lexical_cast<T> (value);
		}
		catch (boost::bad_lexical_cast &)
		{
			conditionally_set_error<T> (escrow::error_config::invalid_value, true, key);
		}
	}

	void construct (std::string const & key, escrow::amount & target)
	{
		auto value (tree.get<std::string> (key));
		if (target.decode_dec (value))
		{
			conditionally_set_error<escrow::amount> (escrow::error_config::invalid_value, true, key);
		}
	}

	/** Accepts either an account string or a hex encoded 256-bit value */
	void construct (std::string const & key, escrow::uint256_union & target)
	{
		auto value (tree.get<std::string> (key));
		if (!value.empty () && target.decode_account (value) && target.decode_hex (value))
		{
			conditionally_set_error<escrow::uint256_union> (escrow::error_config::invalid_value, true, key);
		}
	}

	/** Sets error if not optional or the key is present and not empty */
	template <typename T>
	void conditionally_set_error (escrow::error_config error_a, bool optional, std::string const & key)
	{
		if (!optional)
		{
			*error = error_a;
			error->set_message ("Missing configuration value: " + key);
		}
		else if (error_a == escrow::error_config::invalid_value)
		{
			*error = error_a;
			error->set_message ("Invalid configuration value: " + key);
		}
	}

	template <typename T>
	void get_config (bool optional, std::string key, T & target, T default_value = T ())
	{
		try
		{
			if (tree.count (key) != 0)
			{
				construct (key, target);
			}
			else
			{
				if (!optional)
				{
					conditionally_set_error<T> (escrow::error_config::missing_value, optional, key);
				}
				else
				{
					target = default_value;
				}
			}
		}
		catch (boost::property_tree::ptree_bad_path const &)
		{
			conditionally_set_error<T> (escrow::error_config::missing_value, optional, key);
		}
		catch (std::runtime_error const & ex)
		{
			conditionally_set_error<T> (escrow::error_config::invalid_value, optional, key);
			error->set_message (ex.what ());
		}
	}

	/** Boolean values accept "true"/"false" as well as 1/0 */
	void construct (std::string const & key, bool & target)
	{
		auto bool_conv = [this, &target, &key](std::string val) {
			if (val == "true")
			{
				target = true;
			}
			else if (val == "false")
			{
				target = false;
			}
			else if (!*error)
			{
				*error = escrow::error_config::invalid_value;
				error->set_message ("Invalid configuration value: " + key);
			}
		};
		auto val (tree.get<std::string> (key));
		bool_conv (val == "1" ? "true" : val == "0" ? "false" : val);
	}

private:
	/** The error state is shared by child config nodes */
	std::shared_ptr<escrow::error> error;
	/** The property node being managed */
	boost::property_tree::ptree & tree;
	boost::property_tree::ptree tree_default;

	escrow::error & read (boost::filesystem::path const & path_a)
	{
		std::fstream stream;
		open_or_create (stream, path_a.string ());
		if (!stream.fail ())
		{
			try
			{
				boost::property_tree::read_json (stream, tree);
			}
			catch (std::runtime_error const & ex)
			{
				auto pos (stream.tellg ());
				if (pos != std::streampos (0))
				{
					*error = ex;
				}
			}
			stream.close ();
		}
		return *error;
	}
};
}

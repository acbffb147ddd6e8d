#include "keyring/cli.hpp"
#include "keyring/config.hpp"
#include "keyring/entry.hpp"
#include "keyring/sample_store.hpp"
#include <CLI/CLI.hpp>
#include <format>
#include <iostream>
#include <ostream>
#include <nlohmann/json.hpp>
#include <vector>

namespace keyring::cli
{

	namespace
	{
		Result<Attributes> parse_pairs(const std::vector<std::string> &pairs)
		{
			Attributes out;
			for (const auto &pair : pairs)
			{
				auto eq = pair.find('=');
				if (eq == std::string::npos)
					return std::unexpected(KeyringError::invalid(pair, "expected key=value"));
				out[pair.substr(0, eq)] = pair.substr(eq + 1);
			}
			return out;
		}

		nlohmann::json describe_entry(const Entry &entry)
		{
			nlohmann::json j;
			if (auto spec = entry.get_specifiers())
			{
				j["service"] = spec->first;
				j["user"] = spec->second;
			}
			auto attrs = entry.get_attributes();
			if (attrs)
				j["attributes"] = *attrs;
			else
				j["error"] = attrs.error().what();
			return j;
		}

		int report(const KeyringError &err)
		{
			std::cerr << err.what() << std::endl;
			if (err.code == ErrorCode::Ambiguous)
			{
				for (const auto &entry : err.ambiguous_entries())
					std::cerr << "  " << describe_entry(entry).dump() << std::endl;
			}
			return err.code == ErrorCode::NoEntry ? 2 : 1;
		}

		Result<Entry> make_entry(const std::string &service,
								 const std::string &user,
								 const std::vector<std::string> &modifier_pairs)
		{
			if (modifier_pairs.empty())
				return Entry::create(service, user);
			auto mods = parse_pairs(modifier_pairs);
			if (!mods)
				return std::unexpected(mods.error());
			return Entry::create_with_modifiers(service, user, *mods);
		}

		// e1 is a plain service/user entry; e2..eN are forced duplicates of it.
		Result<Entry> make_ambiguous_entries(int count, std::ostream &out)
		{
			out << std::format("Creating {} ambiguous entries, with comments e1...e{}", count, count) << std::endl;
			auto e1 = Entry::create("svc", "usr");
			if (!e1)
				return e1;
			if (auto res = e1->set_password("password set before ambiguity"); !res)
				return std::unexpected(res.error());
			if (auto res = e1->update_attributes({{"comment", "e1"}}); !res)
				return std::unexpected(res.error());
			for (int i = 2; i <= count; ++i)
			{
				auto extra = Entry::create_with_modifiers("svc", "usr", {{"force-create", std::format("e{}", i)}});
				if (!extra)
					return extra;
			}
			return e1;
		}

		// Keep the credential commented "e1", delete the others.
		Result<void> keep_e1(const Entry &entry,
							 const std::string &comment,
							 const std::string &uuid,
							 const std::string &password,
							 std::ostream &out)
		{
			if (comment == "e1")
			{
				out << std::format("Found wrapper for e1 with uuid {}, setting its password", uuid) << std::endl;
				return entry.set_password(password);
			}
			out << std::format("Found wrapper for {} with uuid {}, deleting it", comment, uuid) << std::endl;
			return entry.delete_credential();
		}

		Result<void> resolve_with_entries(const std::vector<Entry> &entries, std::ostream &out)
		{
			for (const auto &entry : entries)
			{
				auto attrs = entry.get_attributes();
				if (!attrs)
					return std::unexpected(attrs.error());
				auto comment = attrs->contains("comment") ? attrs->at("comment") : std::string("(none)");
				auto res = keep_e1(entry, comment, attrs->at("uuid"), "password set while using entry to resolve ambiguity", out);
				if (!res)
					return res;
			}
			return {};
		}

		Result<void> resolve_with_creds(const std::vector<Entry> &entries, std::ostream &out)
		{
			for (const auto &entry : entries)
			{
				auto cred = entry.as<sample::CredKey>();
				if (!cred)
					return std::unexpected(KeyringError::invalid("entry", "not a sample credential"));
				auto comment = cred->get_comment();
				if (!comment)
					return std::unexpected(comment.error());
				auto uuid = cred->get_uuid();
				if (!uuid)
					return std::unexpected(uuid.error());
				auto res = keep_e1(entry, comment->value_or("(none)"), *uuid, "password set while using cred to resolve ambiguity", out);
				if (!res)
					return res;
			}
			return {};
		}

		// Releasing the default store lets a file-backed store save itself.
		int finish(int code)
		{
			unset_default_store();
			return code;
		}
	} // namespace

	Result<void> ambiguity_demo(int count, std::ostream &out)
	{
		auto store = get_default_store();
		if (!store || store->vendor() != sample::Store::vendor_name)
			return std::unexpected(KeyringError::invalid("store", "ambiguity-demo needs the sample store"));

		using Resolver = Result<void> (*)(const std::vector<Entry> &, std::ostream &);
		for (Resolver resolver : {&resolve_with_entries, &resolve_with_creds})
		{
			auto e1 = make_ambiguous_entries(count, out);
			if (!e1)
				return std::unexpected(e1.error());

			auto pw = e1->get_password();
			if (pw)
				return std::unexpected(KeyringError::invalid("svc", "expected an ambiguity error but got a password"));
			if (pw.error().code != ErrorCode::Ambiguous)
				return std::unexpected(pw.error());

			if (auto res = resolver(pw.error().ambiguous_entries(), out); !res)
				return res;

			auto resolved = e1->get_password();
			if (!resolved)
				return std::unexpected(resolved.error());
			out << std::format("After resolution, got password '{}'", *resolved) << std::endl;

			if (auto res = e1->delete_credential(); !res)
				return res;
		}
		return {};
	}

	int run(int argc, char *argv[])
	{
		CLI::App app{"keyring credential store tool"};
		app.require_subcommand(1);

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML");

		std::string service;
		std::string user;
		std::vector<std::string> modifiers;

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");

		std::string password;
		auto set_cmd = app.add_subcommand("set", "Set the password of an entry");
		set_cmd->add_option("--service", service, "Service name")->required();
		set_cmd->add_option("--user", user, "User name")->required();
		set_cmd->add_option("--password", password, "Password to store")->required();
		set_cmd->add_option("--modifier", modifiers, "Store modifier as key=value (repeatable)");

		bool hex_output{false};
		auto get_cmd = app.add_subcommand("get", "Print the password of an entry");
		get_cmd->add_option("--service", service, "Service name")->required();
		get_cmd->add_option("--user", user, "User name")->required();
		get_cmd->add_flag("--hex", hex_output, "Print the raw secret as hex");

		auto attrs_cmd = app.add_subcommand("attributes", "Print the attributes of an entry");
		attrs_cmd->add_option("--service", service, "Service name")->required();
		attrs_cmd->add_option("--user", user, "User name")->required();

		auto del_cmd = app.add_subcommand("delete", "Delete the credential of an entry");
		del_cmd->add_option("--service", service, "Service name")->required();
		del_cmd->add_option("--user", user, "User name")->required();

		std::vector<std::string> search_pairs;
		auto search_cmd = app.add_subcommand("search", "Search for credentials");
		search_cmd->add_option("--match", search_pairs, "Field pattern as key=regex (repeatable)");

		int demo_count{4};
		auto demo_cmd = app.add_subcommand("ambiguity-demo", "Create and resolve ambiguous credentials");
		demo_cmd->add_option("--count", demo_count, "Number of ambiguous credentials")->check(CLI::Range(2, 100));

		CLI11_PARSE(app, argc, argv);

		auto cfg = config_path.empty() ? ConfigLoader::from_string("") : ConfigLoader::load(config_path);
		if (!cfg)
		{
			std::cerr << cfg.error().what() << std::endl;
			return 1;
		}

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		if (auto res = apply_log_config(*cfg); !res)
			return report(res.error());

		auto store = make_store(*cfg);
		if (!store)
			return report(store.error());
		set_default_store(std::move(*store));

		if (*set_cmd)
		{
			auto entry = make_entry(service, user, modifiers);
			if (!entry)
				return finish(report(entry.error()));
			if (auto res = entry->set_password(password); !res)
				return finish(report(res.error()));
			return finish(0);
		}

		if (*get_cmd)
		{
			auto entry = Entry::create(service, user);
			if (!entry)
				return finish(report(entry.error()));
			if (hex_output)
			{
				auto secret = entry->get_secret();
				if (!secret)
					return finish(report(secret.error()));
				std::string hex;
				for (auto b : *secret)
					hex += std::format("{:02x}", b);
				std::cout << hex << std::endl;
				return finish(0);
			}
			auto pw = entry->get_password();
			if (!pw)
				return finish(report(pw.error()));
			std::cout << *pw << std::endl;
			return finish(0);
		}

		if (*attrs_cmd)
		{
			auto entry = Entry::create(service, user);
			if (!entry)
				return finish(report(entry.error()));
			auto attrs = entry->get_attributes();
			if (!attrs)
				return finish(report(attrs.error()));
			std::cout << nlohmann::json(*attrs).dump(2) << std::endl;
			return finish(0);
		}

		if (*del_cmd)
		{
			auto entry = Entry::create(service, user);
			if (!entry)
				return finish(report(entry.error()));
			if (auto res = entry->delete_credential(); !res)
				return finish(report(res.error()));
			return finish(0);
		}

		if (*search_cmd)
		{
			auto spec = parse_pairs(search_pairs);
			if (!spec)
				return finish(report(spec.error()));
			auto found = Entry::search(*spec);
			if (!found)
				return finish(report(found.error()));
			nlohmann::json out = nlohmann::json::array();
			for (const auto &entry : *found)
				out.push_back(describe_entry(entry));
			std::cout << out.dump(2) << std::endl;
			return finish(0);
		}

		if (*demo_cmd)
		{
			if (auto res = ambiguity_demo(demo_count, std::cout); !res)
				return finish(report(res.error()));
			return finish(0);
		}

		std::cout << app.help() << std::endl;
		return finish(0);
	}

} // namespace keyring::cli

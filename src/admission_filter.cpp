/*

Copyright (c) 2026, the swarmgate authors
All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions
are met:

    * Redistributions of source code must retain the above copyright
      notice, this list of conditions and the following disclaimer.
    * Redistributions in binary form must reproduce the above copyright
      notice, this list of conditions and the following disclaimer in
      the documentation and/or other materials provided with the distribution.
    * Neither the name of the author nor the names of its
      contributors may be used to endorse or promote products derived
      from this software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE
LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
POSSIBILITY OF SUCH DAMAGE.

*/

#include "swarmgate/admission_filter.hpp"
#include "swarmgate/ban_range_index.hpp"
#include "swarmgate/aux_/escape_string.hpp"

#include <algorithm>

namespace swarmgate {

	admission_filter::admission_filter(ban_range_index const& bans
		, gateway_logger* log)
		: m_bans(bans)
		, m_log(log)
		, m_extensions(std::make_shared<extension_list const>())
	{}

	admission_result admission_filter::evaluate(std::string const& info_hash
		, tracker_request const& req, address const& client) const
	{
		if (req.malformed)
		{
#ifndef SWARMGATE_DISABLE_LOGGING
			if (m_log && m_log->should_log(log_module::admission))
			{
				m_log->log(log_module::admission, "malformed request from %s: %s"
					, print_address(client).c_str(), req.malformed_reason.c_str());
			}
#endif
			return admission_result(errors::malformed_request
				, req.malformed_reason.empty()
					? std::string("malformed request") : req.malformed_reason);
		}

		if (m_bans.query(client))
		{
#ifndef SWARMGATE_DISABLE_LOGGING
			if (m_log && m_log->should_log(log_module::admission))
			{
				m_log->log(log_module::admission, "banned address %s [%s]"
					, print_address(client).c_str(), aux::to_hex(info_hash).c_str());
			}
#endif
			return admission_result(errors::banned_address, "IP address is banned");
		}

		auto const extensions = std::atomic_load(&m_extensions);
		for (auto const& e : *extensions)
		{
			admission_result r = e.second(info_hash, req, client);
			if (r.allowed()) continue;

#ifndef SWARMGATE_DISABLE_LOGGING
			if (m_log && m_log->should_log(log_module::admission))
			{
				m_log->log(log_module::admission, "%s denied %s: %s"
					, e.first.c_str(), print_address(client).c_str(), r.message.c_str());
			}
#endif
			if (r.message.empty()) r.message = "request denied";
			return r;
		}

		return admission_result::allow();
	}

	void admission_filter::add_extension(std::string const& name
		, admission_predicate pred)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		auto next = std::make_shared<extension_list>(*m_extensions);
		auto i = std::find_if(next->begin(), next->end()
			, [&name](extension_list::value_type const& e) { return e.first == name; });
		if (i != next->end()) i->second = std::move(pred);
		else next->emplace_back(name, std::move(pred));
		std::shared_ptr<extension_list const> n = std::move(next);
		std::atomic_store(&m_extensions, n);
	}

	bool admission_filter::remove_extension(std::string const& name)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		auto next = std::make_shared<extension_list>(*m_extensions);
		auto i = std::find_if(next->begin(), next->end()
			, [&name](extension_list::value_type const& e) { return e.first == name; });
		if (i == next->end()) return false;
		next->erase(i);
		std::shared_ptr<extension_list const> n = std::move(next);
		std::atomic_store(&m_extensions, n);
		return true;
	}

	std::vector<std::string> admission_filter::extension_names() const
	{
		auto const extensions = std::atomic_load(&m_extensions);
		std::vector<std::string> ret;
		ret.reserve(extensions->size());
		for (auto const& e : *extensions) ret.push_back(e.first);
		return ret;
	}
}

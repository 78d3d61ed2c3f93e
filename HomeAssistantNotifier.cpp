#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>

#include <ArduinoJson.h>
#include <curl/curl.h>

#include "HomeAssistantNotifier.hpp"

#include "DhcpLeaseFile.hpp"
#include "Log.hpp"

//=============================================================================================
HomeAssistantNotifier::HomeAssistantNotifier(const std::string&          host,
                                             const std::string&          token,
                                             const std::chrono::seconds& home_ttl,
                                             const std::chrono::seconds& away_ttl,
                                             const std::chrono::seconds& timeout,
                                             const std::string&          device_id_prefix,
                                             const std::string&          dhcp_domain,
                                             const DhcpLeaseFile&        lease_file,
                                             Log&                        log) :
    authorization_header("Authorization: Bearer " + token),
    home_ttl(home_ttl),
    away_ttl(away_ttl),
    timeout(timeout),
    device_id_prefix(device_id_prefix),
    dhcp_domain(dhcp_domain),
    lease_file(lease_file),
    log(log),
    curl(0)
{
    // Tolerate a trailing slash on the configured host
    std::string base_url = host;
    while (!base_url.empty() && base_url[base_url.length() - 1] == '/')
    {
        base_url.erase(base_url.length() - 1);
    }
    service_url = base_url + "/api/services/device_tracker/see";

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
    {
        throw std::runtime_error("Cannot initialize libcurl");
    }

    curl = curl_easy_init();
    if (!curl)
    {
        curl_global_cleanup();
        throw std::runtime_error("Cannot create libcurl handle");
    }
}

//=============================================================================================
HomeAssistantNotifier::~HomeAssistantNotifier()
{
    curl_easy_cleanup(curl);
    curl_global_cleanup();
}

//=============================================================================================
// Issues one device_tracker.see call; no retries
//=============================================================================================
void HomeAssistantNotifier::notify(const std::string& device_id, bool home)
{
    std::string body;
    buildRequestBody(device_id, home, body);

    std::ostringstream message_stream;
    message_stream << "Calling Home Assistant for " << device_id << " with home time of "
                   << (home ? home_ttl : away_ttl).count() << " s";
    log.write(message_stream.str());

    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';

    struct curl_slist* headers = 0;
    headers = curl_slist_append(headers, authorization_header.c_str());
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, service_url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.length()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &HomeAssistantNotifier::discardResponse);

    CURLcode result = curl_easy_perform(curl);

    curl_slist_free_all(headers);

    if (result != CURLE_OK)
    {
        throw std::runtime_error("POST to " + service_url + " failed: " +
                                 (error_buffer[0] != '\0' ?
                                  std::string(error_buffer) :
                                  std::string(curl_easy_strerror(result))));
    }
}

//=============================================================================================
void HomeAssistantNotifier::buildRequestBody(const std::string& device_id,
                                             bool               home,
                                             std::string&       body) const
{
    std::string ip_address;
    std::string hostname;
    lease_file.lookup(device_id, ip_address, hostname);

    DynamicJsonDocument document(1024);
    document["mac"]           = device_id;
    document["dev_id"]        = getTrackerId(device_id, hostname);
    document["source_type"]   = "router";
    document["consider_home"] = static_cast<long>((home ? home_ttl : away_ttl).count());

    if (!hostname.empty())
    {
        document["host_name"] = dhcp_domain.empty() ? hostname : hostname + "." + dhcp_domain;
    }

    if (document.overflowed())
    {
        throw std::runtime_error("Request body for " + device_id + " does not fit");
    }

    body.clear();
    serializeJson(document, body);
}

//=============================================================================================
// Uses the DHCP hostname when there is one, otherwise the MAC with underscores
//=============================================================================================
std::string HomeAssistantNotifier::getTrackerId(const std::string& device_id,
                                                const std::string& hostname) const
{
    std::string tracker_id = hostname;
    if (tracker_id.empty())
    {
        tracker_id = device_id;
        for (std::string::iterator iter = tracker_id.begin(); iter != tracker_id.end(); ++iter)
        {
            if (*iter == ':')
            {
                *iter = '_';
            }
        }
    }

    if (!device_id_prefix.empty())
    {
        tracker_id = device_id_prefix + "_" + tracker_id;
    }

    return tracker_id;
}

//=============================================================================================
const std::string& HomeAssistantNotifier::getServiceUrl() const
{
    return service_url;
}

//=============================================================================================
size_t HomeAssistantNotifier::discardResponse(char*  data,
                                              size_t size,
                                              size_t count,
                                              void*  user_data)
{
    return size * count;
}

#include "storage/object_store.h"
#include "storage/key_schema.h"
#include "storage/predicate_eval.h"
#include "utils/datetime.h"
#include "utils/logger.h"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace trivium {

using json = nlohmann::json;

ObjectStore::ObjectStore(RocksDBWrapper& db, const SchemaProvider* schema) : db_(db), schema_(schema) {}

std::string ObjectStore::encode(const ObjectInstance& obj) {
	json j{
		{"id", obj.id},
		{"type", obj.object_type_name},
		{"weight", obj.weight},
		{"upsert", obj.upsert_date_ms},
		{"props", obj.properties}
	};
	auto bytes = json::to_msgpack(j);
	return std::string(bytes.begin(), bytes.end());
}

std::optional<ObjectInstance> ObjectStore::decode(std::string_view blob) {
	auto j = json::from_msgpack(blob.begin(), blob.end(), true, false);
	if (j.is_discarded() || !j.is_object()) return std::nullopt;
	ObjectInstance obj;
	try {
		obj.id = j.at("id").get<std::string>();
		obj.object_type_name = j.at("type").get<std::string>();
		obj.weight = j.at("weight").get<double>();
		obj.upsert_date_ms = j.at("upsert").get<int64_t>();
		obj.properties = j.at("props");
	} catch (const json::exception& e) {
		TRIVIUM_WARN("ObjectStore: corrupt object record: {}", e.what());
		return std::nullopt;
	}
	return obj;
}

ObjectStore::Status ObjectStore::upsert(ObjectInstance obj) {
	if (!db_.isOpen()) return Status::Error("upsert: Datenbank ist nicht geöffnet");
	if (!KeySchema::isValidSegment(obj.object_type_name)) {
		return Status::Error("upsert: invalid object type name '" + obj.object_type_name + "'");
	}
	if (!KeySchema::isValidSegment(obj.id)) {
		return Status::Error("upsert: invalid id '" + obj.id + "' (empty or contains ':')");
	}
	if (obj.weight < 0.0 || obj.weight > 10.0) {
		return Status::Error("upsert: weight muss in [0, 10] liegen");
	}
	if (!obj.properties.is_object()) {
		return Status::Error("upsert: properties must be an object");
	}
	if (obj.upsert_date_ms == 0) obj.upsert_date_ms = utils::nowEpochMs();

	if (!db_.put(KeySchema::makeObjectKey(obj.object_type_name, obj.id), encode(obj))) {
		return Status::Error("upsert: RocksDB put failed for " + obj.object_type_name + ":" + obj.id);
	}
	TRIVIUM_TRACE("ObjectStore: upserted {}:{}", obj.object_type_name, obj.id);
	return Status::OK();
}

ObjectStore::Status ObjectStore::remove(std::string_view objectType, std::string_view id) {
	if (!db_.isOpen()) return Status::Error("remove: Datenbank ist nicht geöffnet");
	if (!db_.del(KeySchema::makeObjectKey(objectType, id))) {
		return Status::Error("remove: RocksDB delete failed");
	}
	return Status::OK();
}

std::optional<ObjectInstance> ObjectStore::get(std::string_view objectType, std::string_view id) const {
	auto blob = db_.get(KeySchema::makeObjectKey(objectType, id));
	if (!blob) return std::nullopt;
	return decode(*blob);
}

std::optional<ObjectTypeDefinition> ObjectStore::typeDefinition_(const std::string& objectType) const {
	if (!schema_) return std::nullopt;
	return schema_->getObjectType(objectType);
}

bool ObjectStore::matches(const ObjectInstance& obj, const std::vector<query::RelationalFilter>& filters) const {
	auto def = typeDefinition_(obj.object_type_name);
	return PredicateEvaluator::matchesAll(obj, filters, def ? &*def : nullptr);
}

std::pair<ObjectStore::Status, std::vector<std::string>>
ObjectStore::filterIds(const std::string& objectType,
                       const std::vector<query::RelationalFilter>& filters,
                       RestrictSet restrict) const {
	if (!db_.isOpen()) return {Status::Error("filterIds: Datenbank ist nicht geöffnet"), {}};
	if (!KeySchema::isValidSegment(objectType)) {
		return {Status::Error("filterIds: invalid object type name '" + objectType + "'"), {}};
	}

	auto def = typeDefinition_(objectType);
	const ObjectTypeDefinition* type = def ? &*def : nullptr;

	std::vector<std::string> out;
	size_t corrupt = 0;

	if (restrict) {
		// Punktabfragen nur für die Kandidaten
		auto [st, objects] = getObjectsByIds(objectType, *restrict);
		if (!st.ok) return {st, {}};
		for (const auto& obj : objects) {
			if (PredicateEvaluator::matchesAll(obj, filters, type)) out.push_back(obj.id);
		}
	} else {
		bool scanned = db_.scanPrefix(KeySchema::makeObjectPrefix(objectType), [&](std::string_view, std::string_view value) {
			auto obj = decode(value);
			if (!obj) {
				++corrupt;
				return true;
			}
			if (PredicateEvaluator::matchesAll(*obj, filters, type)) out.push_back(obj->id);
			return true;
		});
		if (!scanned) return {Status::Error("filterIds: scan of " + objectType + " failed"), {}};
	}

	if (corrupt > 0) {
		return {Status::Error("filterIds: " + std::to_string(corrupt) + " corrupt record(s) in " + objectType), {}};
	}
	std::sort(out.begin(), out.end());
	return {Status::OK(), std::move(out)};
}

std::pair<ObjectStore::Status, std::vector<std::string>>
ObjectStore::allIds(const std::string& objectType) const {
	if (!db_.isOpen()) return {Status::Error("allIds: Datenbank ist nicht geöffnet"), {}};
	if (!KeySchema::isValidSegment(objectType)) {
		return {Status::Error("allIds: invalid object type name '" + objectType + "'"), {}};
	}
	std::vector<std::string> ids;
	bool scanned = db_.scanPrefix(KeySchema::makeObjectPrefix(objectType), [&ids](std::string_view key, std::string_view) {
		ids.push_back(KeySchema::extractId(key));
		return true;
	});
	// Ein unvollständiges Extent würde NOT-Komplemente verfälschen
	if (!scanned) return {Status::Error("allIds: scan of " + objectType + " failed"), {}};
	return {Status::OK(), std::move(ids)};
}

std::pair<ObjectStore::Status, std::vector<ObjectInstance>>
ObjectStore::getObjectsByIds(const std::string& objectType, const std::vector<std::string>& ids) const {
	if (!db_.isOpen()) return {Status::Error("getObjectsByIds: Datenbank ist nicht geöffnet"), {}};

	std::vector<std::string> keys;
	keys.reserve(ids.size());
	for (const auto& id : ids) keys.push_back(KeySchema::makeObjectKey(objectType, id));

	std::vector<ObjectInstance> out;
	out.reserve(ids.size());
	auto blobs = db_.multiGet(keys);
	for (size_t i = 0; i < blobs.size(); ++i) {
		if (!blobs[i]) continue; // unbekannte Ids überspringen
		auto obj = decode(*blobs[i]);
		if (!obj) return {Status::Error("getObjectsByIds: corrupt record " + keys[i]), {}};
		out.push_back(std::move(*obj));
	}
	return {Status::OK(), std::move(out)};
}

} // namespace trivium

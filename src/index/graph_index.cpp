#include "index/graph_index.h"
#include "storage/key_schema.h"
#include "storage/object_store.h"
#include "utils/datetime.h"
#include "utils/logger.h"

#include <algorithm>
#include <iterator>

namespace trivium {

using json = nlohmann::json;

GraphIndexManager::GraphIndexManager(RocksDBWrapper& db, const ObjectStore& objects)
	: db_(db), objects_(objects) {}

std::string GraphIndexManager::encode(const RelationInstance& rel) {
	json j{
		{"id", rel.id},
		{"type", rel.relation_type_name},
		{"from", rel.source_object_instance_id},
		{"to", rel.target_object_instance_id},
		{"weight", rel.weight},
		{"upsert", rel.upsert_date_ms},
		{"props", rel.properties}
	};
	auto bytes = json::to_msgpack(j);
	return std::string(bytes.begin(), bytes.end());
}

std::optional<RelationInstance> GraphIndexManager::decode(std::string_view blob) {
	auto j = json::from_msgpack(blob.begin(), blob.end(), true, false);
	if (j.is_discarded() || !j.is_object()) return std::nullopt;
	RelationInstance rel;
	try {
		rel.id = j.at("id").get<std::string>();
		rel.relation_type_name = j.at("type").get<std::string>();
		rel.source_object_instance_id = j.at("from").get<std::string>();
		rel.target_object_instance_id = j.at("to").get<std::string>();
		rel.weight = j.at("weight").get<double>();
		rel.upsert_date_ms = j.at("upsert").get<int64_t>();
		rel.properties = j.at("props");
	} catch (const json::exception& e) {
		TRIVIUM_WARN("GraphIndex: corrupt relation record: {}", e.what());
		return std::nullopt;
	}
	return rel;
}

GraphIndexManager::Status GraphIndexManager::addRelation(RelationInstance rel) {
	if (!db_.isOpen()) return Status::Error("addRelation: Datenbank ist nicht geöffnet");
	if (!KeySchema::isValidSegment(rel.relation_type_name)) return Status::Error("addRelation: invalid relation type name");
	if (!KeySchema::isValidSegment(rel.id)) return Status::Error("addRelation: invalid edge id '" + rel.id + "'");
	if (!KeySchema::isValidSegment(rel.source_object_instance_id) || !KeySchema::isValidSegment(rel.target_object_instance_id)) {
		return Status::Error("addRelation: source und target sind erforderlich");
	}
	if (rel.weight < 0.0 || rel.weight > 10.0) return Status::Error("addRelation: weight muss in [0, 10] liegen");
	if (rel.upsert_date_ms == 0) rel.upsert_date_ms = utils::nowEpochMs();

	// Alte Adjazenz entfernen, falls die Kante ersetzt wird
	auto previous = getRelation(rel.relation_type_name, rel.id);

	auto batch = db_.createWriteBatch();
	if (previous) {
		batch->del(KeySchema::makeOutgoingKey(rel.relation_type_name, previous->source_object_instance_id, rel.id));
		batch->del(KeySchema::makeIncomingKey(rel.relation_type_name, previous->target_object_instance_id, rel.id));
	}
	batch->put(KeySchema::makeRelationKey(rel.relation_type_name, rel.id), encode(rel));
	batch->put(KeySchema::makeOutgoingKey(rel.relation_type_name, rel.source_object_instance_id, rel.id),
	           rel.target_object_instance_id);
	batch->put(KeySchema::makeIncomingKey(rel.relation_type_name, rel.target_object_instance_id, rel.id),
	           rel.source_object_instance_id);
	if (!batch->commit()) return Status::Error("addRelation: Commit des Batches fehlgeschlagen");

	TRIVIUM_TRACE("GraphIndex: {} {} -> {}", rel.relation_type_name, rel.source_object_instance_id, rel.target_object_instance_id);
	return Status::OK();
}

GraphIndexManager::Status GraphIndexManager::deleteRelation(std::string_view relationType, std::string_view edgeId) {
	if (!db_.isOpen()) return Status::Error("deleteRelation: Datenbank ist nicht geöffnet");
	auto rel = getRelation(relationType, edgeId);
	if (!rel) return Status::OK();

	auto batch = db_.createWriteBatch();
	batch->del(KeySchema::makeRelationKey(relationType, edgeId));
	batch->del(KeySchema::makeOutgoingKey(relationType, rel->source_object_instance_id, edgeId));
	batch->del(KeySchema::makeIncomingKey(relationType, rel->target_object_instance_id, edgeId));
	if (!batch->commit()) return Status::Error("deleteRelation: Commit des Batches fehlgeschlagen");
	return Status::OK();
}

std::optional<RelationInstance> GraphIndexManager::getRelation(std::string_view relationType, std::string_view edgeId) const {
	auto blob = db_.get(KeySchema::makeRelationKey(relationType, edgeId));
	if (!blob) return std::nullopt;
	return decode(*blob);
}

std::pair<GraphIndexManager::Status, std::vector<std::string>>
GraphIndexManager::neighbors_(const std::string& prefix) const {
	if (!db_.isOpen()) return {Status::Error("neighbors: Datenbank ist nicht geöffnet"), {}};
	std::vector<std::string> out;
	bool scanned = db_.scanPrefix(prefix, [&out](std::string_view, std::string_view value) {
		out.emplace_back(value);
		return true;
	});
	if (!scanned) return {Status::Error("neighbors: scan of " + prefix + " failed"), {}};
	std::sort(out.begin(), out.end());
	out.erase(std::unique(out.begin(), out.end()), out.end());
	return {Status::OK(), std::move(out)};
}

std::pair<GraphIndexManager::Status, std::vector<std::string>>
GraphIndexManager::outNeighbors(std::string_view relationType, std::string_view sourceId) const {
	if (!KeySchema::isValidSegment(sourceId)) return {Status::Error("outNeighbors: invalid source id"), {}};
	return neighbors_(KeySchema::makeOutgoingPrefix(relationType, sourceId));
}

std::pair<GraphIndexManager::Status, std::vector<std::string>>
GraphIndexManager::inNeighbors(std::string_view relationType, std::string_view targetId) const {
	if (!KeySchema::isValidSegment(targetId)) return {Status::Error("inNeighbors: invalid target id"), {}};
	return neighbors_(KeySchema::makeIncomingPrefix(relationType, targetId));
}

std::pair<GraphIndexManager::Status, std::vector<std::string>>
GraphIndexManager::matchingTargets_(const query::GraphTraversalClause& traversal) const {
	const auto& targetType = traversal.target_object_type_name;
	if (traversal.target_object_id) {
		if (!KeySchema::isValidSegment(*traversal.target_object_id)) return {Status::OK(), {}};
		auto obj = objects_.get(targetType, *traversal.target_object_id);
		if (!obj) return {Status::OK(), {}};
		std::vector<std::string> ids;
		if (objects_.matches(*obj, traversal.target_object_properties)) ids.push_back(obj->id);
		return {Status::OK(), std::move(ids)};
	}
	return objects_.filterIds(targetType, traversal.target_object_properties);
}

std::pair<GraphIndexManager::Status, std::vector<std::string>>
GraphIndexManager::filterByTraversal(const std::string& sourceType,
                                     const query::GraphTraversalClause& traversal,
                                     RestrictSet restrict) const {
	if (!db_.isOpen()) return {Status::Error("filterByTraversal: Datenbank ist nicht geöffnet"), {}};
	if (!KeySchema::isValidSegment(traversal.relation_type_name)) {
		return {Status::Error("filterByTraversal: invalid relation type name"), {}};
	}

	auto [tst, targets] = matchingTargets_(traversal);
	if (!tst.ok) return {tst, {}};
	if (targets.empty()) return {Status::OK(), {}};

	// Von den passenden Zielknoten rückwärts zu den Quellknoten laufen:
	// outgoing -> rin-Index der Ziele liefert Quellen, incoming -> rout-Index
	const bool outgoing = traversal.direction == query::TraversalDirection::Outgoing;
	std::vector<std::string> sources;
	for (const auto& target : targets) {
		auto [st, ids] = outgoing ? inNeighbors(traversal.relation_type_name, target)
		                          : outNeighbors(traversal.relation_type_name, target);
		if (!st.ok) return {st, {}};
		sources.insert(sources.end(), ids.begin(), ids.end());
	}
	std::sort(sources.begin(), sources.end());
	sources.erase(std::unique(sources.begin(), sources.end()), sources.end());

	if (restrict) {
		std::vector<std::string> clipped;
		std::set_intersection(sources.begin(), sources.end(), restrict->begin(), restrict->end(),
		                      std::back_inserter(clipped));
		sources.swap(clipped);
	}

	// Quellen müssen Objekte des angefragten Typs sein
	auto [ost, existing] = objects_.getObjectsByIds(sourceType, sources);
	if (!ost.ok) return {ost, {}};
	std::vector<std::string> out;
	out.reserve(existing.size());
	for (const auto& o : existing) out.push_back(o.id);
	std::sort(out.begin(), out.end());
	return {Status::OK(), std::move(out)};
}

} // namespace trivium
